/***
 * Name: agentrun::container::ParseContainerState / ToString
 * Purpose: Convert between Docker status words and ContainerState.
 */
#include "agentrun/container/container_runtime.h"

#include <array>
#include <string>
#include <string_view>
#include <utility>

namespace agentrun {
namespace container {

namespace {
constexpr std::array<std::pair<std::string_view, ContainerState>, 7> kStates{{
    {"created", ContainerState::Created},
    {"running", ContainerState::Running},
    {"paused", ContainerState::Paused},
    {"restarting", ContainerState::Restarting},
    {"removing", ContainerState::Removing},
    {"exited", ContainerState::Exited},
    {"dead", ContainerState::Dead},
}};
}  // namespace

ContainerState ParseContainerState(const std::string& text) {
  for (const auto& [word, state] : kStates) {
    if (word == text) return state;
  }
  return ContainerState::Unknown;
}

const char* ToString(const ContainerState state) {
  for (const auto& [word, value] : kStates) {
    if (value == state) return word.data();
  }
  return "unknown";
}

}  // namespace container
}  // namespace agentrun
