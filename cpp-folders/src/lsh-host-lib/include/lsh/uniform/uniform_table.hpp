#pragma once

/*
    LSH ШЭЙДЕР ХОСТ САН

    ФАЙЛ: uniform_table.hpp
    МОДУЛЬ: uniform
    ЗОРИЛГО: Бүх pass-ын program хамтран уншдаг нэр -> (tag, утга) хүснэгт.
            Шинэ нэр нэмэгдэх, tag солигдох, нэр устах бүрт layout version өснө.
*/


#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>

#include "lsh/uniform/uniform_value.hpp"

namespace lsh
{
    class UniformTable
    {
    public:
        // Утгыг бичнэ. Нэр шинэ эсвэл tag өөрчлөгдсөн бол layout version өснө.
        void set(const std::string& name, UniformValue value)
        {
            auto it = values_.find(name);
            if (it == values_.end())
            {
                values_.emplace(name, std::move(value));
                ++layout_version_;
                return;
            }
            const bool tag_changed = it->second.index() != value.index();
            it->second = std::move(value);
            if (tag_changed) ++layout_version_;
        }

        void set_float(const std::string& name, float v) { set(name, v); }
        void set_int(const std::string& name, int32_t v) { set(name, v); }
        void set_vec2(const std::string& name, const glm::vec2& v) { set(name, v); }
        void set_vec3(const std::string& name, const glm::vec3& v) { set(name, v); }
        void set_texture(const std::string& name, TextureHandle v) { set(name, v); }

        bool erase(const std::string& name)
        {
            if (values_.erase(name) == 0) return false;
            ++layout_version_;
            return true;
        }

        bool contains(const std::string& name) const
        {
            return values_.find(name) != values_.end();
        }

        // Буцаасан заагч нь layout version өөрчлөгдөх хүртэл хүчинтэй.
        const UniformValue* find(const std::string& name) const
        {
            auto it = values_.find(name);
            return it == values_.end() ? nullptr : &it->second;
        }

        template<typename T>
        const T* get(const std::string& name) const
        {
            const UniformValue* v = find(name);
            return v ? std::get_if<T>(v) : nullptr;
        }

        bool type_of(const std::string& name, UniformType& out) const
        {
            const UniformValue* v = find(name);
            if (!v) return false;
            out = uniform_type_of(*v);
            return true;
        }

        uint64_t layout_version() const { return layout_version_; }
        size_t size() const { return values_.size(); }

        const std::unordered_map<std::string, UniformValue>& entries() const { return values_; }

    private:
        std::unordered_map<std::string, UniformValue> values_{};
        uint64_t layout_version_ = 1;
    };
}
