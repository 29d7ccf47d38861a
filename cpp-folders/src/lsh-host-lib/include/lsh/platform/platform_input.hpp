#pragma once

/*
    LSH ШЭЙДЕР ХОСТ САН

    ФАЙЛ: platform_input.hpp
    МОДУЛЬ: platform
    ЗОРИЛГО: Нэг pump_input() дуудлагаар цугласан цонхны оролт.
*/


#include <cstdint>
#include <vector>

namespace lsh
{
    struct KeyEvent
    {
        // DOM KeyboardEvent.keyCode-той ижил дугаарлалт.
        int key_code = 0;
        bool down = false;
    };

    struct PlatformInputState
    {
        bool quit = false;
        bool toggle_play = false;
        bool reset_time = false;

        bool resized = false;
        int width = 0;
        int height = 0;

        bool pointer_moved = false;
        double pointer_x = 0.0;
        double pointer_y = 0.0;
        // DOM MouseEvent.buttons маск.
        uint32_t buttons = 0;

        std::vector<KeyEvent> keys{};
    };
}
