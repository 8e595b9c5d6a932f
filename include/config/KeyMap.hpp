#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace rondo::config {

// Maps key names ("space", "enter", "left", "q", ...) to action names.
class KeyMap {
public:
    KeyMap();

    // Every bindable action, in display order
    static const std::vector<std::string>& actions();

    void load_default_keybinds();

    // Rebinds an action; the action's previous key is released.
    void add_binding(const std::string& action, const std::string& key_sequence);

    // Applies config overrides; unknown actions are ignored with a warning.
    void apply(const std::unordered_map<std::string, std::string>& overrides);

    std::string lookup_action(const std::string& key_sequence) const;
    std::string key_for(const std::string& action) const;

private:
    std::unordered_map<std::string, std::string> bindings_;  // key -> action
};

}  // namespace rondo::config
