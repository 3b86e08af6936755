#include <gtest/gtest.h>
#include "custom_profile.h"
#include "errors.h"
#include "image_loader.h"
#include "shape_grids.h"
#include <cstdio>
#include <fstream>

using namespace ShapeKit;

namespace {
    std::shared_ptr<const ShapeGrid> Plane(int rows, int cols) {
        ShapeParams p;
        p.rows = rows;
        p.cols = cols;
        return MakeShapeGrid(ShapeKind::Plane, p);
    }

    // Binary PGM, pixel rows listed top to bottom.
    void WritePgm(const std::string& path, int width, int height, const std::vector<unsigned char>& pixels) {
        std::ofstream out(path, std::ios::binary);
        out << "P5\n" << width << " " << height << "\n255\n";
        out.write(reinterpret_cast<const char*>(pixels.data()), static_cast<std::streamsize>(pixels.size()));
    }

    // Binary PPM, RGB triples, rows top to bottom.
    void WritePpm(const std::string& path, int width, int height, const std::vector<unsigned char>& pixels) {
        std::ofstream out(path, std::ios::binary);
        out << "P6\n" << width << " " << height << "\n255\n";
        out.write(reinterpret_cast<const char*>(pixels.data()), static_cast<std::streamsize>(pixels.size()));
    }

    // Uncompressed 32-bit TGA, RGBA quadruples, rows top to bottom.
    void WriteTga(const std::string& path, int width, int height, const std::vector<unsigned char>& rgba) {
        unsigned char header[18] = {};
        header[2] = 2; // uncompressed true color
        header[12] = static_cast<unsigned char>(width & 0xff);
        header[13] = static_cast<unsigned char>(width >> 8);
        header[14] = static_cast<unsigned char>(height & 0xff);
        header[15] = static_cast<unsigned char>(height >> 8);
        header[16] = 32;
        header[17] = 0x28; // 8 alpha bits, top-left origin

        std::ofstream out(path, std::ios::binary);
        out.write(reinterpret_cast<const char*>(header), sizeof(header));
        for (size_t k = 0; k + 3 < rgba.size(); k += 4) {
            const char bgra[4] = {
                static_cast<char>(rgba[k + 2]),
                static_cast<char>(rgba[k + 1]),
                static_cast<char>(rgba[k]),
                static_cast<char>(rgba[k + 3]),
            };
            out.write(bgra, 4);
        }
    }
}

TEST(CustomProfileTest, BilinearResampleKeepsCorners) {
    Field map(2, 2);
    map << 0.0, 1.0,
           2.0, 3.0;
    Field out = ResampleBilinear(map, 3, 3);
    EXPECT_DOUBLE_EQ(out(0, 0), 0.0);
    EXPECT_DOUBLE_EQ(out(0, 2), 1.0);
    EXPECT_DOUBLE_EQ(out(2, 0), 2.0);
    EXPECT_DOUBLE_EQ(out(2, 2), 3.0);
    EXPECT_DOUBLE_EQ(out(0, 1), 0.5);
    EXPECT_DOUBLE_EQ(out(1, 1), 1.5);
}

TEST(CustomProfileTest, ResampleSameSizeIsIdentity) {
    Field map = Field::Random(4, 5);
    Field out = ResampleBilinear(map, 4, 5);
    EXPECT_TRUE((out == map).all());
}

TEST(CustomProfileTest, ScaleToPeak) {
    Field map(1, 2);
    map << 1.0, -2.0;
    Field out = ScaleToPeak(map, 0.5);
    EXPECT_DOUBLE_EQ(out(0, 0), 0.25);
    EXPECT_DOUBLE_EQ(out(0, 1), -0.5);

    Field zero = ScaleToPeak(Field::Zero(2, 2), 0.5);
    EXPECT_DOUBLE_EQ(zero.abs().maxCoeff(), 0.0);
}

TEST(CustomProfileTest, MatrixIsResampledAndScaled) {
    auto grid = Plane(3, 3);
    CustomProfileAdapter adapter(*grid, 0.0, OverlapPolicy::Sum);
    std::mt19937 rng(1);

    Field map(2, 2);
    map << 0.0, 2.0,
           4.0, 8.0;
    Field f = adapter.Evaluate(map, 0.1, rng);
    ASSERT_EQ(f.rows(), 3);
    ASSERT_EQ(f.cols(), 3);
    EXPECT_NEAR(f(2, 2), 0.1, 1e-15);
    EXPECT_NEAR(f(0, 1), 0.0125, 1e-15);
    EXPECT_DOUBLE_EQ(f(0, 0), 0.0);
}

TEST(CustomProfileTest, EmptyMatrixThrows) {
    auto grid = Plane(3, 3);
    CustomProfileAdapter adapter(*grid, 0.0, OverlapPolicy::Sum);
    std::mt19937 rng(1);
    EXPECT_THROW(adapter.Evaluate(Field(0, 0), 0.1, rng), ConfigurationError);
}

TEST(CustomProfileTest, ImageIsGrayscaleAndFlipped) {
    const std::string path = "test_custom_profile.pgm";
    WritePgm(path, 3, 2, {0, 0, 0, 255, 255, 255});

    Field image = LoadGrayscaleImage(path);
    ASSERT_EQ(image.rows(), 2);
    ASSERT_EQ(image.cols(), 3);
    // Bottom image row becomes row 0.
    EXPECT_DOUBLE_EQ(image(0, 0), 1.0);
    EXPECT_DOUBLE_EQ(image(1, 0), 0.0);

    auto grid = Plane(2, 3);
    CustomProfileAdapter adapter(*grid, 0.0, OverlapPolicy::Sum);
    std::mt19937 rng(1);
    Field f = adapter.Evaluate(ImageFile{path}, 0.2, rng);
    EXPECT_DOUBLE_EQ(f(0, 1), 0.2);
    EXPECT_DOUBLE_EQ(f(1, 1), 0.0);
    std::remove(path.c_str());
}

TEST(CustomProfileTest, ColorImageAveragesChannels) {
    const std::string path = "test_custom_profile.ppm";
    // Top pixel (10, 20, 60), bottom pixel (255, 0, 0).
    WritePpm(path, 1, 2, {10, 20, 60, 255, 0, 0});

    Field image = LoadGrayscaleImage(path);
    ASSERT_EQ(image.rows(), 2);
    ASSERT_EQ(image.cols(), 1);
    EXPECT_NEAR(image(0, 0), 85.0 / 255.0, 1e-12);
    EXPECT_NEAR(image(1, 0), 30.0 / 255.0, 1e-12);
    std::remove(path.c_str());
}

TEST(CustomProfileTest, AlphaChannelIsIgnored) {
    const std::string path = "test_custom_profile.tga";
    WriteTga(path, 2, 1, {30, 60, 90, 0, 30, 60, 90, 255});

    Field image = LoadGrayscaleImage(path);
    ASSERT_EQ(image.rows(), 1);
    ASSERT_EQ(image.cols(), 2);
    // Averaging all four channels would give 45/255 and 108.75/255.
    EXPECT_NEAR(image(0, 0), 60.0 / 255.0, 1e-12);
    EXPECT_NEAR(image(0, 1), 60.0 / 255.0, 1e-12);
    std::remove(path.c_str());
}

TEST(CustomProfileTest, UnreadableImageThrows) {
    auto grid = Plane(4, 4);
    CustomProfileAdapter adapter(*grid, 0.0, OverlapPolicy::Sum);
    std::mt19937 rng(1);
    EXPECT_THROW(adapter.Evaluate(ImageFile{"no_such_image_shapekit.png"}, 0.1, rng), ConfigurationError);
}

TEST(CustomProfileTest, FunctionDelegatesToBumpPlacement) {
    auto grid = Plane(8, 8);
    CustomProfileAdapter adapter(*grid, 0.0, OverlapPolicy::Sum);
    std::mt19937 rng(1);

    CustomFunction fn;
    fn.profile = [](double, const std::vector<double>& params) { return params[0] * params[1]; };
    fn.types = {BumpType::Custom({2, 10.0, 0.1, 0.5})};
    Field f = adapter.Evaluate(fn, 0.0, rng);
    EXPECT_TRUE(f.isApprox(Field::Constant(8, 8, 0.1)));

    CustomFunction empty;
    EXPECT_THROW(adapter.Evaluate(empty, 0.0, rng), ConfigurationError);
}
