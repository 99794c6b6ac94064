#pragma once

// ============================================================
// passphrase.hpp -- Obtain the shared passphrase for --secure
// ============================================================

#include <string>

// Environment variable consulted before prompting
static constexpr const char* PASSPHRASE_ENV = "TREEPIPE_PASSPHRASE";

// TREEPIPE_PASSPHRASE if set, otherwise prompt on the terminal with
// echo disabled. The trailing newline is stripped.
// Throws UsageError for an empty passphrase.
std::string acquire_passphrase();
