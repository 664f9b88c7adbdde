#include "acolib/core/solver.hpp"

int main(int argc, char *argv[]) {
    // 1. Instantiate the solver
    acolib::AcoSolver aco;

    // 2. Read CLI and configuration
    int status = aco.init(argc, argv);

    // --help exits cleanly, anything else is an error
    if (status != 0) return (status > 0) ? 0 : 1;

    // 3. Run the colony
    try {
        aco.run();
    } catch (const std::exception &e) {
        std::cerr << "Execution Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
