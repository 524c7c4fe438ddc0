// src/anchorband/utils/config.cpp
#include "anchorband/utils/config.hpp"

namespace anchorband {
namespace utils {

// Define static members
std::shared_ptr<Config> Config::instance_ = nullptr;
std::mutex Config::instance_mutex_;

} // namespace utils
} // namespace anchorband
