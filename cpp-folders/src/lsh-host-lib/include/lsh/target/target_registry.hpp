#pragma once

/*
    LSH ШЭЙДЕР ХОСТ САН

    ФАЙЛ: target_registry.hpp
    МОДУЛЬ: target
    ЗОРИЛГО: Нэг pipeline-ын нэр -> RenderTargetPair бүртгэл. Нэр бүрт нэг физик хос,
            анх зарласан pass-ын формат хүчинтэй. Бүртгэлийг устгахад бүх хос dispose болно.
*/


#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "lsh/core/log.hpp"
#include "lsh/target/render_target_pair.hpp"

namespace lsh
{
    class TargetRegistry
    {
    public:
        explicit TargetRegistry(IGpuDevice& device)
            : device_(&device)
        {}

        ~TargetRegistry()
        {
            dispose_all();
        }

        TargetRegistry(const TargetRegistry&) = delete;
        TargetRegistry& operator=(const TargetRegistry&) = delete;

        RenderTargetPair& ensure(const std::string& name, int width, int height, TextureFormat format, bool* created = nullptr)
        {
            auto it = pairs_.find(name);
            if (it != pairs_.end())
            {
                if (created) *created = false;
                if (it->second->format() != format)
                {
                    log_warn("target '" + name + "': format differs from first declaration, keeping the first one");
                }
                return *it->second;
            }

            auto pair = std::make_unique<RenderTargetPair>(*device_, name, width, height, format);
            RenderTargetPair& ref = *pair;
            pairs_.emplace(name, std::move(pair));
            order_.push_back(name);
            if (created) *created = true;
            return ref;
        }

        RenderTargetPair* find(const std::string& name)
        {
            auto it = pairs_.find(name);
            return it == pairs_.end() ? nullptr : it->second.get();
        }

        const RenderTargetPair* find(const std::string& name) const
        {
            auto it = pairs_.find(name);
            return it == pairs_.end() ? nullptr : it->second.get();
        }

        bool contains(const std::string& name) const { return pairs_.find(name) != pairs_.end(); }
        size_t size() const { return pairs_.size(); }

        // Анх зарласан дарааллаар.
        const std::vector<std::string>& names() const { return order_; }

        void dispose_all()
        {
            for (const std::string& name : order_)
            {
                auto it = pairs_.find(name);
                if (it != pairs_.end()) it->second->dispose();
            }
        }

    private:
        IGpuDevice* device_ = nullptr;
        std::unordered_map<std::string, std::unique_ptr<RenderTargetPair>> pairs_{};
        std::vector<std::string> order_{};
    };
}
