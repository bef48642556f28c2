#pragma once

// Raw device snapshot, sampled once per frame by InputGatherSystem.
// Indexed by Raylib key / mouse-button codes.
struct InputRecord {
    // Keyboard
    bool keys_down[512] = {false};
    bool keys_pressed[512] = {false};

    // Mouse
    bool mouse_buttons[8] = {false};
};
