#include <cstdio>
#include <memory>
#include <string>
#include <vector>

#include "lsh/pipeline/pipeline.hpp"
#include "lsh/uniform/builtin_uniforms.hpp"
#include "recording_gpu_device.hpp"

namespace
{
    const char* kTimeFs = "uniform float time;\nvoid main() { gl_FragColor = vec4(time); }\n";
    const char* kSampleAFs = "uniform sampler2D A;\nuniform vec2 resolution;\n"
                             "void main() { gl_FragColor = texture2D(A, gl_FragCoord.xy / resolution); }\n";
    const char* kBrokenFs = "#error intentionally broken\nvoid main() {}\n";
    const char* kPointsVs = "attribute float vertexId;\nuniform float vertexCount;\nvarying vec4 v_color;\n"
                            "void main() { gl_Position = vec4(vertexId / vertexCount); v_color = vec4(1.0); }\n";

    lsh::PassSpec target_pass(const char* fs, const char* target)
    {
        lsh::PassSpec s = lsh::fragment_pass(fs);
        s.target = target;
        return s;
    }

    struct Fixture
    {
        lsh_test::RecordingGpuDevice dev{};
        lsh::UniformTable table{};

        Fixture()
        {
            lsh::install_builtin_uniforms(table, 3000.0f);
        }

        lsh::PipelineBuildContext context()
        {
            lsh::PipelineBuildContext ctx{};
            ctx.device = &dev;
            ctx.uniforms = &table;
            ctx.buffer_width = 800.0;
            ctx.buffer_height = 600.0;
            return ctx;
        }
    };

    bool test_rejects_empty_and_shaderless_specs()
    {
        Fixture f{};
        lsh::Result<std::unique_ptr<lsh::Pipeline>> none = lsh::Pipeline::build({}, f.context());
        if (none.ok || none.error != "pipeline needs at least one pass") return false;

        std::vector<lsh::PassSpec> specs = {lsh::fragment_pass(kTimeFs), lsh::PassSpec{}};
        specs[1].target = "B";
        lsh::Result<std::unique_ptr<lsh::Pipeline>> r = lsh::Pipeline::build(specs, f.context());
        if (r.ok || r.kind != lsh::ErrorKind::Configuration) return false;
        if (r.error != "pass 1: shaders must have fs or vs") return false;
        // Шалгалт GPU объект үүсгэхээс өмнө явагдана.
        return f.dev.programs_created == 0 && f.dev.framebuffers_created == 0;
    }

    bool test_one_pair_per_distinct_target_name()
    {
        Fixture f{};
        const std::vector<lsh::PassSpec> specs = {
            target_pass(kTimeFs, "A"),
            target_pass(kSampleAFs, "B"),
            target_pass(kTimeFs, "A"),
            lsh::fragment_pass(kSampleAFs),
        };
        lsh::Result<std::unique_ptr<lsh::Pipeline>> r = lsh::Pipeline::build(specs, f.context());
        if (!r.ok) return false;
        lsh::Pipeline& p = *r.value;

        if (p.size() != 4 || p.targets().size() != 2) return false;
        if (f.dev.live_framebuffers() != 4) return false;
        if (p.pass(0).target() != p.pass(2).target()) return false;
        if (p.pass(3).has_target()) return false;

        const lsh::FramebufferDesc desc = f.dev.framebuffer_desc(p.pass(1).target()->front_framebuffer());
        if (desc.width != 800 || desc.height != 600 || !desc.depth) return false;

        p.install_target_uniforms(f.table);
        const lsh::TextureHandle* a = f.table.get<lsh::TextureHandle>("A");
        if (!a || !(*a == p.pass(0).target()->current_texture())) return false;

        p.resize_targets(320, 200);
        if (!(p.pass(1).target()->back_extent() == lsh::Extent2D{320, 200})) return false;

        r.value.reset();
        return f.dev.live_framebuffers() == 0 && f.dev.live_programs() == 0 && f.dev.live_geometries() == 0
            && f.dev.invalid_calls == 0;
    }

    bool test_compile_failure_releases_partial_build()
    {
        Fixture f{};
        const std::vector<lsh::PassSpec> specs = {
            target_pass(kTimeFs, "A"),
            target_pass(kBrokenFs, "B"),
            lsh::fragment_pass(kSampleAFs),
        };
        lsh::Result<std::unique_ptr<lsh::Pipeline>> r = lsh::Pipeline::build(specs, f.context());
        if (r.ok || r.value) return false;
        if (r.error.find("pass 1: ") != 0 || r.error.find("#error") == std::string::npos) return false;
        if (f.dev.compile_failures != 1) return false;
        return f.dev.live_programs() == 0 && f.dev.live_framebuffers() == 0 && f.dev.live_geometries() == 0;
    }

    bool test_uniform_type_mismatch_is_reported()
    {
        Fixture f{};
        const std::vector<lsh::PassSpec> specs = {
            lsh::fragment_pass("uniform vec2 time;\nvoid main() { gl_FragColor = vec4(time, 0.0, 1.0); }\n"),
        };
        lsh::Result<std::unique_ptr<lsh::Pipeline>> r = lsh::Pipeline::build(specs, f.context());
        if (r.ok) return false;
        if (r.error != "pass 0: uniform 'time' is declared vec2 but the host provides float") return false;
        return f.dev.live_programs() == 0;
    }

    bool test_target_names_bind_as_textures()
    {
        Fixture f{};
        // Шинэ pipeline-ын target нэр нь хүснэгтэд байхгүй ч sampler гэж тооцогдоно.
        {
            const std::vector<lsh::PassSpec> specs = {
                target_pass(kTimeFs, "A"),
                lsh::fragment_pass("uniform float A;\nvoid main() { gl_FragColor = vec4(A); }\n"),
            };
            lsh::Result<std::unique_ptr<lsh::Pipeline>> r = lsh::Pipeline::build(specs, f.context());
            if (r.ok || r.error.find("declared float but the host provides sampler2D") == std::string::npos) return false;
        }

        // Хуучин pipeline-ын target нэр устах тул ямар ч tag-аар зарлаж болно.
        f.table.set_texture("old", lsh::TextureHandle{99});
        lsh::PipelineBuildContext ctx = f.context();
        ctx.retiring_targets = {"old"};
        const std::vector<lsh::PassSpec> specs = {
            lsh::fragment_pass("uniform float old;\nvoid main() { gl_FragColor = vec4(old); }\n"),
        };
        lsh::Result<std::unique_ptr<lsh::Pipeline>> ok = lsh::Pipeline::build(specs, ctx);
        return ok.ok;
    }

    bool test_vertex_and_fragment_paths()
    {
        Fixture f{};
        lsh::PipelineBuildContext ctx = f.context();
        ctx.primitive = lsh::DrawPrimitive::LineStrip;
        ctx.vertex_count = 500;
        const std::vector<lsh::PassSpec> specs = {lsh::fragment_pass(kTimeFs), lsh::vertex_pass(kPointsVs)};
        lsh::Result<std::unique_ptr<lsh::Pipeline>> r = lsh::Pipeline::build(specs, ctx);
        if (!r.ok) return false;

        const lsh::RenderPassResources& quad = r.value->pass(0).resources();
        const lsh::GeometryDesc* qg = f.dev.geometry_desc(quad.geometry);
        const lsh::ProgramSource* qs = f.dev.program_source(quad.program.id);
        if (!qg || qg->kind != lsh::GeometryKind::FullscreenQuad) return false;
        if (!qs || !qs->enable_derivatives || qs->vertex != lsh::kDefaultVertexShader) return false;
        if (quad.primitive != lsh::DrawPrimitive::Triangles || quad.raster.blend != lsh::BlendMode::Opaque) return false;
        if (quad.raster.depth_test) return false;

        const lsh::RenderPassResources& pts = r.value->pass(1).resources();
        const lsh::GeometryDesc* pg = f.dev.geometry_desc(pts.geometry);
        const lsh::ProgramSource* ps = f.dev.program_source(pts.program.id);
        if (!pg || pg->kind != lsh::GeometryKind::ProceduralVertices || pg->vertex_count != 500) return false;
        if (!ps || ps->enable_derivatives || ps->fragment != lsh::kDefaultFragmentShader) return false;
        if (pts.primitive != lsh::DrawPrimitive::LineStrip) return false;
        return pts.raster.blend == lsh::BlendMode::Additive && pts.raster.depth_test && pts.raster.double_sided;
    }

    bool test_size_expressions_resolve_against_buffer()
    {
        Fixture f{};
        lsh::PassSpec half = target_pass(kTimeFs, "A");
        half.width = "$WIDTH/2";
        half.height = "Math.floor($HEIGHT/3)";
        lsh::PassSpec broken = target_pass(kTimeFs, "B");
        broken.width = "$WIDTH +";
        lsh::Result<std::unique_ptr<lsh::Pipeline>> r = lsh::Pipeline::build({half, broken}, f.context());
        if (!r.ok) return false;
        if (!(r.value->pass(0).resolve_size(800, 600) == lsh::Extent2D{400, 200})) return false;
        return r.value->pass(1).resolve_size(800, 600) == lsh::Extent2D{800, 600};
    }

    bool test_execute_uploads_table_and_camera()
    {
        Fixture f{};
        lsh::Result<std::unique_ptr<lsh::Pipeline>> r = lsh::Pipeline::build({lsh::fragment_pass(kTimeFs)}, f.context());
        if (!r.ok) return false;
        lsh::RenderPass& pass = r.value->pass(0);

        f.table.set_float("time", 1.5f);
        pass.execute(f.table, lsh::FramebufferHandle{});
        if (f.dev.draws.size() != 1) return false;
        const lsh_test::DrawRecord& d0 = f.dev.draws[0];
        if (d0.framebuffer != 0) return false;
        auto t = d0.values.find("time");
        if (t == d0.values.end() || std::get<float>(t->second) != 1.5f) return false;
        auto proj = d0.values.find("projectionMatrix");
        if (proj == d0.values.end()) return false;
        if (!(std::get<glm::mat4>(proj->second) == pass.camera().projection_matrix())) return false;

        // Tag солигдсон uniform алгасагдана, бусад нь хэвээр.
        f.table.set_int("time", 3);
        pass.execute(f.table, lsh::FramebufferHandle{});
        const lsh_test::DrawRecord& d1 = f.dev.draws[1];
        if (d1.values.count("time") != 0) return false;
        if (d1.values.count("modelViewMatrix") != 1) return false;

        // Ижил tag буцаж ирвэл дахин холбогдоно.
        f.table.set_float("time", 2.0f);
        pass.execute(f.table, lsh::FramebufferHandle{});
        auto t2 = f.dev.draws[2].values.find("time");
        return t2 != f.dev.draws[2].values.end() && std::get<float>(t2->second) == 2.0f;
    }
}

int main()
{
    const bool ok_reject = test_rejects_empty_and_shaderless_specs();
    const bool ok_pairs = test_one_pair_per_distinct_target_name();
    const bool ok_compile = test_compile_failure_releases_partial_build();
    const bool ok_mismatch = test_uniform_type_mismatch_is_reported();
    const bool ok_targets = test_target_names_bind_as_textures();
    const bool ok_paths = test_vertex_and_fragment_paths();
    const bool ok_size = test_size_expressions_resolve_against_buffer();
    const bool ok_exec = test_execute_uploads_table_and_camera();

    if (!ok_reject) std::fprintf(stderr, "[pipeline-tests] spec validation failed\n");
    if (!ok_pairs) std::fprintf(stderr, "[pipeline-tests] target pair sharing failed\n");
    if (!ok_compile) std::fprintf(stderr, "[pipeline-tests] compile failure cleanup failed\n");
    if (!ok_mismatch) std::fprintf(stderr, "[pipeline-tests] uniform type mismatch failed\n");
    if (!ok_targets) std::fprintf(stderr, "[pipeline-tests] target uniform staging failed\n");
    if (!ok_paths) std::fprintf(stderr, "[pipeline-tests] vertex/fragment paths failed\n");
    if (!ok_size) std::fprintf(stderr, "[pipeline-tests] size expressions failed\n");
    if (!ok_exec) std::fprintf(stderr, "[pipeline-tests] execute uploads failed\n");

    if (!(ok_reject && ok_pairs && ok_compile && ok_mismatch && ok_targets && ok_paths && ok_size && ok_exec)) return 1;
    std::fprintf(stderr, "[pipeline-tests] all tests passed\n");
    return 0;
}
