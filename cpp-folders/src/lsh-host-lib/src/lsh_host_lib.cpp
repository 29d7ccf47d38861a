/*
    LSH ШЭЙДЕР ХОСТ САН

    ФАЙЛ: lsh_host_lib.cpp
    МОДУЛЬ: lsh-host-lib
    ЗОРИЛГО: Compiled library target anchor translation unit.
*/

#include "lsh/driver/frame_driver.hpp"
#include "lsh/loader/audio_input_provider.hpp"
#include "lsh/loader/camera_provider.hpp"
#include "lsh/loader/gamepad_provider.hpp"
#include "lsh/loader/video_provider.hpp"

namespace lsh
{
    int lsh_host_compiled_target_anchor()
    {
        return 0;
    }
}
