#include "config/KeyMap.hpp"
#include "util/Logger.hpp"
#include <algorithm>

namespace rondo::config {

KeyMap::KeyMap() {
    load_default_keybinds();
}

const std::vector<std::string>& KeyMap::actions() {
    static const std::vector<std::string> all = {
        "play_pause", "play_selected", "stop", "next",
        "seek_forward", "seek_backward", "volume_up", "volume_down",
        "select_up", "select_down", "reload", "quit",
    };
    return all;
}

void KeyMap::load_default_keybinds() {
    bindings_.clear();
    bindings_["space"] = "play_pause";
    bindings_["enter"] = "play_selected";
    bindings_["s"] = "stop";
    bindings_["n"] = "next";
    bindings_["right"] = "seek_forward";
    bindings_["left"] = "seek_backward";
    bindings_["+"] = "volume_up";
    bindings_["-"] = "volume_down";
    bindings_["up"] = "select_up";
    bindings_["down"] = "select_down";
    bindings_["r"] = "reload";
    bindings_["q"] = "quit";
}

void KeyMap::add_binding(const std::string& action, const std::string& key_sequence) {
    std::erase_if(bindings_, [&](const auto& entry) { return entry.second == action; });
    bindings_[key_sequence] = action;
}

void KeyMap::apply(const std::unordered_map<std::string, std::string>& overrides) {
    const auto& known = actions();
    for (const auto& [action, key] : overrides) {
        if (std::find(known.begin(), known.end(), action) == known.end()) {
            util::Logger::warn("KeyMap: Unknown action '" + action + "' in keybinds");
            continue;
        }
        if (key.empty()) continue;
        add_binding(action, key);
    }
}

std::string KeyMap::lookup_action(const std::string& key_sequence) const {
    auto it = bindings_.find(key_sequence);
    if (it != bindings_.end()) {
        return it->second;
    }
    return "";
}

std::string KeyMap::key_for(const std::string& action) const {
    for (const auto& [key, bound] : bindings_) {
        if (bound == action) return key;
    }
    return "";
}

}  // namespace rondo::config
