#pragma once
#include <opencv2/core/utility.hpp>

#include "config.hpp"

namespace vdet {

// Key table for cv::CommandLineParser. Numeric overrides default to -1,
// meaning "keep the config value".
const char* cliKeys();

// Config file named by --config (if any), then every flag that was given.
// Out-of-range flags are kept as given so validate() reports them.
JobConfig configFromArgs(const cv::CommandLineParser& p);

}  // namespace vdet
