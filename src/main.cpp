//! # maplint Entry Point

#include "cli/driver.hpp"

int main(int argc, char* argv[]) {
    return maplint::cli::maplint_main(argc, argv);
}
