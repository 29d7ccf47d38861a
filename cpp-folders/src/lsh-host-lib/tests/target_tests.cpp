#include <cstdio>
#include <string>

#include "lsh/target/render_target_pair.hpp"
#include "lsh/target/target_registry.hpp"
#include "recording_gpu_device.hpp"

namespace
{
    bool test_swap_twice_restores_roles()
    {
        lsh_test::RecordingGpuDevice dev{};
        lsh::RenderTargetPair pair(dev, "A", 64, 32, lsh::TextureFormat::RGBA8);

        const lsh::FramebufferHandle front = pair.front_framebuffer();
        const lsh::FramebufferHandle back = pair.back_framebuffer();
        if (front == back) return false;

        pair.swap();
        if (!(pair.front_framebuffer() == back) || !(pair.back_framebuffer() == front)) return false;
        if (!(pair.current_texture() == dev.framebuffer_texture(back))) return false;

        pair.swap();
        return pair.front_framebuffer() == front && pair.back_framebuffer() == back;
    }

    bool test_resize_same_extent_is_noop()
    {
        lsh_test::RecordingGpuDevice dev{};
        lsh::RenderTargetPair pair(dev, "A", 64, 32, lsh::TextureFormat::RGBA8);

        pair.resize(64, 32);
        pair.resize_back(64, 32);
        if (dev.framebuffer_resizes != 0) return false;

        pair.resize_back(16, 8);
        if (dev.framebuffer_resizes != 1) return false;
        if (!(pair.back_extent() == lsh::Extent2D{16, 8})) return false;
        if (!(pair.front_extent() == lsh::Extent2D{64, 32})) return false;

        // Front 64x32 хэвээр тул зөвхөн нэг buffer өөрчлөгдөнө.
        pair.resize(16, 8);
        return dev.framebuffer_resizes == 2 && pair.front_extent() == lsh::Extent2D{16, 8};
    }

    bool test_extents_clamp_to_one()
    {
        lsh_test::RecordingGpuDevice dev{};
        lsh::RenderTargetPair pair(dev, "tiny", 0, -5, lsh::TextureFormat::RGBA32F);
        const lsh::FramebufferDesc desc = dev.framebuffer_desc(pair.front_framebuffer());
        if (desc.width != 1 || desc.height != 1) return false;
        if (desc.format != lsh::TextureFormat::RGBA32F) return false;

        pair.resize_back(-3, 7);
        return pair.back_extent() == lsh::Extent2D{1, 7};
    }

    bool test_use_after_dispose_throws()
    {
        lsh_test::RecordingGpuDevice dev{};
        lsh::RenderTargetPair pair(dev, "A", 8, 8, lsh::TextureFormat::RGBA8);
        pair.dispose();
        pair.dispose();
        if (dev.live_framebuffers() != 0 || dev.framebuffers_destroyed != 2) return false;
        if (dev.invalid_calls != 0) return false;

        int thrown = 0;
        try { pair.swap(); } catch (const lsh::ProgrammingError&) { ++thrown; }
        try { (void)pair.current_texture(); } catch (const lsh::ProgrammingError&) { ++thrown; }
        try { pair.resize(4, 4); } catch (const lsh::ProgrammingError&) { ++thrown; }
        try
        {
            pair.resize_back(4, 4);
        }
        catch (const lsh::ProgrammingError& e)
        {
            if (std::string(e.what()).find("render target 'A'") != std::string::npos) ++thrown;
        }
        return thrown == 4;
    }

    bool test_registry_shares_pairs_per_name()
    {
        lsh_test::RecordingGpuDevice dev{};
        {
            lsh::TargetRegistry reg(dev);
            bool created = false;
            lsh::RenderTargetPair& a = reg.ensure("A", 32, 32, lsh::TextureFormat::RGBA8, &created);
            if (!created) return false;
            lsh::RenderTargetPair& b = reg.ensure("B", 16, 16, lsh::TextureFormat::RGBA32F, &created);
            if (!created) return false;
            lsh::RenderTargetPair& a2 = reg.ensure("A", 8, 8, lsh::TextureFormat::RGBA32F, &created);
            if (created || &a != &a2) return false;
            // Анх зарласан формат хэвээр.
            if (a2.format() != lsh::TextureFormat::RGBA8) return false;
            if (reg.size() != 2 || dev.live_framebuffers() != 4) return false;
            if (reg.names().size() != 2 || reg.names()[0] != "A" || reg.names()[1] != "B") return false;
            if (reg.find("B") != &b || reg.find("C") != nullptr) return false;
        }
        return dev.live_framebuffers() == 0 && dev.invalid_calls == 0;
    }
}

int main()
{
    const bool ok_swap = test_swap_twice_restores_roles();
    const bool ok_resize = test_resize_same_extent_is_noop();
    const bool ok_clamp = test_extents_clamp_to_one();
    const bool ok_dispose = test_use_after_dispose_throws();
    const bool ok_registry = test_registry_shares_pairs_per_name();

    if (!ok_swap) std::fprintf(stderr, "[target-tests] swap role exchange failed\n");
    if (!ok_resize) std::fprintf(stderr, "[target-tests] resize no-op failed\n");
    if (!ok_clamp) std::fprintf(stderr, "[target-tests] extent clamp failed\n");
    if (!ok_dispose) std::fprintf(stderr, "[target-tests] use after dispose failed\n");
    if (!ok_registry) std::fprintf(stderr, "[target-tests] registry sharing failed\n");

    if (!(ok_swap && ok_resize && ok_clamp && ok_dispose && ok_registry)) return 1;
    std::fprintf(stderr, "[target-tests] all tests passed\n");
    return 0;
}
