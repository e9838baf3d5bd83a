/**
 * @file JobSpec.hpp
 * @brief
 */

#pragma once

// Standard Library Includes
#include <string>
#include <vector>

namespace nas_backup::backup_sync
{
struct JobSpec
{
    std::string              name;
    std::string              source;
    std::string              destination;
    std::vector<std::string> exclude;
    bool                     enabled = true;
};
} // namespace nas_backup::backup_sync
