#ifndef PROGRESS_HPP
#define PROGRESS_HPP

#include <cstdint>      // for uint8_t
#include <functional>   // for function
#include <string_view>  // for string_view

namespace pforge {

enum class ProgressEvent : std::uint8_t {
    Started,
    Completed,
    Failed
};

/// @brief Notified around every blocking external operation.
/// @param event What happened to the step.
/// @param description Human readable step description, e.g "Formatting Root partition (/dev/sda3) as ext4".
using ProgressCallback = std::function<void(ProgressEvent event, std::string_view description)>;

}  // namespace pforge

#endif  // PROGRESS_HPP
