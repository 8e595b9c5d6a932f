#pragma once

#include <string>

namespace rondo::ui {

struct InputEvent {
    enum class Type {
        None,
        KeyPress,
        Resize,
    };

    Type type = Type::None;
    int key = 0;           // char code or special key code
    std::string key_name;  // "up", "left", "enter", "space", "backspace", "q", ...

    bool is_key(const std::string& name_to_check) const {
        return type == Type::KeyPress && key_name == name_to_check;
    }
};

// Name used in key bindings for a single byte of input
std::string key_name_for(char c);

} // namespace rondo::ui
