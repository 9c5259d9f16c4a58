//! # CLI Driver Interface
//!
//! `maplint_main()` dispatches to the command handler named by the first
//! non-logging argument.

#pragma once

namespace maplint::cli {

/// Returns the process exit code.
int maplint_main(int argc, char* argv[]);

} // namespace maplint::cli
