#pragma once

#include "config.hpp"
#include "details.hpp"
#include "store_client.hpp"

namespace topsellers {

constexpr int kExitOk      = 0;
constexpr int kExitFailure = 1;   // fatal error or strict-mode page failure
constexpr int kExitPartial = 2;   // best-effort output with missing pages

/// Fetch `cfg.totalPages` pages from @p pages, aggregate them under the
/// configured failure policy, optionally attach details from @p details and
/// write the document to `cfg.outputPath`.
///
/// Progress and the summary report go to stdout, diagnostics to stderr.
/// Nothing is written when the run fails, including when @p cfg is invalid.
/// @return kExitOk, kExitPartial or kExitFailure
int runPipeline(const Config& cfg, PageSource& pages, DetailsSource& details);

} // namespace topsellers
