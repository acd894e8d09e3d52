#include <render/render_command.hpp>
#include <vocab/vocabulary.hpp>
#include <gtest/gtest.h>
#include <numbers>

using namespace csgir;
using Args = std::vector<std::string>;

TEST(RenderCommand, PlainModel) {
    EXPECT_EQ(compose_renderer_command("openscad", "scad/a.scad", std::filesystem::path("render/a.stl")),
              (Args{"openscad", "-o", "render/a.stl", "scad/a.scad"}));
}

TEST(RenderCommand, NoOutput) {
    EXPECT_EQ(compose_renderer_command("openscad", "a.scad", std::nullopt), (Args{"openscad", "a.scad"}));
}

TEST(RenderCommand, ImageOptions) {
    Image image{"a.png", VectorCamera{{10, 20, 30}}, std::array<int, 2>{640, 480}, "Nature"};
    Args expected = {"openscad", "-o", "render/a.png",
                     "--camera", "10,20,30,0,0,0",
                     "--imgsize", "640,480",
                     "--colorscheme", "Nature",
                     "a.scad"};
    EXPECT_EQ(compose_renderer_command("openscad", "a.scad", std::filesystem::path("render/a.png"), &image),
              expected);
}

TEST(RenderCommand, GimbalInDegrees) {
    Gimbal gimbal{{1, 2, 3}, {std::numbers::pi / 2, 0, std::numbers::pi}, 50.5};
    EXPECT_EQ(format_camera(gimbal), "1,2,3,90,0,180,50.5");
}

TEST(RenderCommand, OneJobPerSuffixAndImage) {
    Asset asset(vocab::sphere(1));
    asset.name = "ball";
    asset.suffixes = {".stl", ".3mf"};
    asset.images = {Image{"ball.png"}};

    std::vector<RenderJob> jobs = plan_render_jobs(asset, "out/scad", "out/render");
    ASSERT_EQ(jobs.size(), 3u);
    EXPECT_EQ(jobs[0].output, std::filesystem::path("out/render/ball.stl"));
    EXPECT_EQ(jobs[1].output, std::filesystem::path("out/render/ball.3mf"));
    EXPECT_EQ(jobs[2].output, std::filesystem::path("out/render/ball.png"));
    for (const auto& job : jobs) {
        EXPECT_EQ(job.asset, "ball");
        EXPECT_EQ(job.input, std::filesystem::path("out/scad/ball.scad"));
        EXPECT_EQ(job.command.front(), "openscad");
        EXPECT_EQ(job.command.back(), "out/scad/ball.scad");
    }
}

TEST(RenderCommand, NoSuffixesNoImages) {
    Asset asset(vocab::sphere(1));
    asset.suffixes.clear();
    EXPECT_TRUE(plan_render_jobs(asset, "scad", "render").empty());
}
