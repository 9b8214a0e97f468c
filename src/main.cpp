//! # jemit Entry Point
//!
//! Delegates to the CLI driver (`cli/driver.hpp`).
//!
//! ```bash
//! printf '42\tOrder #42\n7\n' | jemit
//! jemit --compact --output=refs.json refs.tsv
//! ```

#include "cli/driver.hpp"

int main(int argc, char* argv[]) {
    return jemit::cli::jemit_main(argc, argv);
}
