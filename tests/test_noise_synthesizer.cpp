#include <gtest/gtest.h>
#include "errors.h"
#include "noise_synthesizer.h"
#include <cmath>
#include <limits>
#include <string>

using namespace ShapeKit;

namespace {
    Field Coordinates(int rows, int cols, bool along_cols) {
        Field f(rows, cols);
        for (int i = 0; i < rows; ++i) {
            for (int j = 0; j < cols; ++j) {
                f(i, j) = along_cols ? j / static_cast<double>(cols) : i / static_cast<double>(rows);
            }
        }
        return f;
    }
}

TEST(NoiseSynthesizerTest, RowDefaults) {
    auto c = NoiseComponent::FromRow({8});
    EXPECT_DOUBLE_EQ(c.frequency, 8.0);
    EXPECT_DOUBLE_EQ(c.frequency_bandwidth, 1.0);
    EXPECT_DOUBLE_EQ(c.orientation, 0.0);
    EXPECT_DOUBLE_EQ(c.orientation_bandwidth, 30.0);
    EXPECT_DOUBLE_EQ(c.amplitude, 0.1);
    EXPECT_EQ(c.group, 0);

    auto iso = NoiseComponent::FromRow({8, 2, 0, std::numeric_limits<double>::infinity(), 0.05, 2});
    EXPECT_TRUE(iso.IsIsotropic());
    EXPECT_EQ(iso.group, 2);
}

TEST(NoiseSynthesizerTest, BadRowsThrow) {
    EXPECT_THROW(NoiseComponent::FromRow({}), ConfigurationError);
    EXPECT_THROW(NoiseComponent::FromRow({8, 0}), ConfigurationError);
    EXPECT_THROW(NoiseComponent::FromRow({8, 1, 0, -5}), ConfigurationError);
    EXPECT_THROW(NoiseComponent::FromRow({8, 1, 0, 30, 0.1, 0, 7}), ConfigurationError);
}

TEST(NoiseSynthesizerTest, BadRowNamesItsIndex) {
    try {
        NoiseComponent::FromRows({{8}, {4, 1}, {2, -1}});
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_NE(std::string(e.what()).find("noise component 3"), std::string::npos) << e.what();
    }
}

TEST(NoiseSynthesizerTest, NormalizedToAmplitude) {
    NoiseSynthesizer synth(32, 64, 1.0 / 64, 1.0 / 32);
    std::mt19937 rng(7);
    auto c = NoiseComponent::FromRow({8, 1, 0, 30, 0.25});
    Field noise = synth.Synthesize(c, rng);
    ASSERT_EQ(noise.rows(), 32);
    ASSERT_EQ(noise.cols(), 64);
    EXPECT_NEAR(noise.abs().maxCoeff(), 0.25, 1e-12);
}

TEST(NoiseSynthesizerTest, DcRemoved) {
    NoiseSynthesizer synth(32, 32, 1.0 / 32, 1.0 / 32);
    std::mt19937 rng(11);
    auto c = NoiseComponent::FromRow({4, 2, 0, std::numeric_limits<double>::infinity(), 0.1});
    Field noise = synth.Synthesize(c, rng);
    EXPECT_NEAR(noise.mean(), 0.0, 1e-9);
}

TEST(NoiseSynthesizerTest, SameSeedSameField) {
    NoiseSynthesizer synth(16, 16, 1.0 / 16, 1.0 / 16);
    auto c = NoiseComponent::FromRow({4});
    std::mt19937 a(123);
    std::mt19937 b(123);
    Field fa = synth.Synthesize(c, a);
    Field fb = synth.Synthesize(c, b);
    EXPECT_TRUE((fa == fb).all());
}

TEST(NoiseSynthesizerTest, ZeroAmplitudeGivesZeroField) {
    NoiseSynthesizer synth(2, 2, 1.0, 1.0);
    std::mt19937 rng(1);
    Field noise = synth.Synthesize(NoiseComponent::FromRow({8, 1, 0, 30, 0}), rng);
    EXPECT_DOUBLE_EQ(noise.abs().maxCoeff(), 0.0);
}

TEST(NoiseSynthesizerTest, FilterIsSymmetric) {
    NoiseSynthesizer synth(16, 16, 1.0 / 16, 1.0 / 16);
    Field filter = synth.FilterFor(NoiseComponent::FromRow({4, 1, 30, 40}));
    EXPECT_DOUBLE_EQ(filter(0, 0), 0.0);
    EXPECT_GT(filter.maxCoeff(), 0.0);
    for (int r = 0; r < 16; ++r) {
        for (int c = 0; c < 16; ++c) {
            EXPECT_NEAR(filter(r, c), filter((16 - r) % 16, (16 - c) % 16), 1e-12);
        }
    }
}

TEST(NoiseSynthesizerTest, OrientedFilterFollowsOrientation) {
    // Orientation 0 varies along x, so the pass band sits on the column
    // frequency axis and the row frequency axis is blocked.
    NoiseSynthesizer synth(16, 16, 1.0 / 16, 1.0 / 16);
    Field filter = synth.FilterFor(NoiseComponent::FromRow({4, 1, 0, 20}));
    EXPECT_NEAR(filter(0, 4), 1.0, 1e-12);
    EXPECT_DOUBLE_EQ(filter(4, 0), 0.0);
}

TEST(NoiseSynthesizerTest, EmptyPassBandGivesZeroField) {
    // Centre frequency far above Nyquist of a 4x4 grid.
    NoiseSynthesizer synth(4, 4, 1.0 / 4, 1.0 / 4);
    std::mt19937 rng(3);
    Field noise = synth.Synthesize(NoiseComponent::FromRow({1000, 0.5}), rng);
    EXPECT_DOUBLE_EQ(noise.abs().maxCoeff(), 0.0);
}

TEST(NoiseSynthesizerTest, ComposeAppliesGroupModulators) {
    const int rows = 16, cols = 16;
    NoiseSynthesizer synth(rows, cols, 1.0 / cols, 1.0 / rows);
    Field x = Coordinates(rows, cols, true);
    Field y = Coordinates(rows, cols, false);

    auto c = NoiseComponent::FromRow({4, 1, 0, 30, 0.1, 1});
    auto m = SineComponent::Modulator({1, 0, 0, 0, 1});

    std::mt19937 rng(5);
    Field out = synth.Compose({c}, {m}, x, y, rng);
    EXPECT_DOUBLE_EQ(out.abs().maxCoeff(), 0.0);

    std::mt19937 rng2(5);
    Field plain = synth.Compose({c}, {}, x, y, rng2);
    std::mt19937 rng3(5);
    Field single = synth.Synthesize(c, rng3);
    EXPECT_TRUE((plain == single).all());
}
