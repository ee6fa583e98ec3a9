#pragma once

// Installs the stderr logger used for diagnostics. Quiet unless verbose.
void init_logging(bool verbose);
