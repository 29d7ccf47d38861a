#pragma once

/*
    LSH ШЭЙДЕР ХОСТ САН

    ФАЙЛ: ortho_camera.hpp
    МОДУЛЬ: camera
    ЗОРИЛГО: Pass бүрийн ортографик камер. [-1,1] квадратыг бүтэн дэлгэцэнд буулгана.
*/


#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>

namespace lsh
{
    struct OrthoCamera
    {
        float left = -1.0f;
        float right = 1.0f;
        float top = 1.0f;
        float bottom = -1.0f;
        float near_plane = 0.1f;
        float far_plane = 10.0f;
        glm::vec3 position{0.0f, 0.0f, 1.0f};
        glm::vec3 target{0.0f, 0.0f, 0.0f};
        glm::vec3 up{0.0f, 1.0f, 0.0f};

        glm::mat4 projection_matrix() const
        {
            return glm::ortho(left, right, bottom, top, near_plane, far_plane);
        }

        // Scene-ийн mesh нь эх цэг дээр тул model = identity.
        glm::mat4 model_view_matrix() const
        {
            return glm::lookAt(position, target, up);
        }
    };
}
