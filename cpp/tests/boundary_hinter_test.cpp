#include <gtest/gtest.h>
#include "reflow/text/boundary_hinter.h"
#include "tests/reflow_test_common.h"
#include <initializer_list>
#include <memory>
#include <string>
#include <vector>

using namespace reflow::text;
using reflow_test::FakeTokenizer;

namespace {

const std::string kMarker = "\xE2\x80\x8B";

bool startsOrEndsWithMarker(const std::string& s) {
    if (s.size() < kMarker.size()) return false;
    return s.compare(0, kMarker.size(), kMarker) == 0 ||
        s.compare(s.size() - kMarker.size(), kMarker.size(), kMarker) == 0;
}

} // namespace

class BoundaryHinterTest : public ::testing::Test {
protected:
    ShapingConfiguration config;
    FakeTokenizer tokenizer{reflow_test::thaiScenarioWords()};
};

TEST_F(BoundaryHinterTest, InsertsMarkersBetweenThaiWords) {
    BoundaryHinter hinter(config, &tokenizer);
    const std::string text = reflow_test::thaiScenarioText();

    std::size_t inserted = 0;
    const std::string hinted = hinter.hint(text, "th", &inserted);

    EXPECT_EQ(hinted, reflow_test::withMarkers(reflow_test::thaiScenarioWords()));
    EXPECT_EQ(inserted, 5u);
    EXPECT_EQ(tokenizer.calls, 1);
    EXPECT_FALSE(startsOrEndsWithMarker(hinted));
}

TEST_F(BoundaryHinterTest, StrippingMarkersRestoresInput) {
    BoundaryHinter hinter(config, &tokenizer);
    const std::vector<std::string> inputs = {
        reflow_test::thaiScenarioText(),
        "ไก่ที่ hello ป่า",
        "(ไก่) 12 ที่, ป่า!",
        "plain English text",
        "",
    };
    for (const std::string& text : inputs) {
        EXPECT_EQ(stripMarkers(hinter.hint(text, "th")), text) << text;
        EXPECT_EQ(stripMarkers(hinter.hint(text, "en")), text) << text;
    }
}

TEST_F(BoundaryHinterTest, Idempotent) {
    BoundaryHinter hinter(config, &tokenizer);
    const std::vector<std::string> inputs = {
        reflow_test::thaiScenarioText(),
        "ไก่ที่ hello ป่า",
        "ไก่" + kMarker + "ที่เป่าปี่",
        "ในป่า ในป่า",
    };
    for (const std::string& text : inputs) {
        const std::string once = hinter.hint(text, "th");
        EXPECT_EQ(hinter.hint(once, "th"), once) << text;
    }
}

TEST_F(BoundaryHinterTest, TokenizesEachScriptRunOnce) {
    BoundaryHinter hinter(config, &tokenizer);
    const std::string hinted = hinter.hint("ไก่ที่ hello ป่า", "th");

    ASSERT_EQ(tokenizer.calls, 2);
    EXPECT_EQ(tokenizer.seen[0], "ไก่ที่");
    EXPECT_EQ(tokenizer.seen[1], "ป่า");
    EXPECT_EQ(hinted, "ไก่" + kMarker + "ที่ hello ป่า");
}

TEST_F(BoundaryHinterTest, AlreadyHintedRunIsLeftAlone) {
    BoundaryHinter hinter(config, &tokenizer);
    const std::string text = "ไก่" + kMarker + "ที่เป่าปี่";

    EXPECT_EQ(hinter.hint(text, "th"), text);
    EXPECT_EQ(tokenizer.calls, 0);
}

TEST_F(BoundaryHinterTest, PlaceholdersAreNotTokenized) {
    BoundaryHinter hinter(config, &tokenizer);
    hinter.hint("ไก่{v1}ที่", "th");

    ASSERT_EQ(tokenizer.calls, 2);
    for (const std::string& run : tokenizer.seen) {
        EXPECT_EQ(run.find('{'), std::string::npos);
    }
}

TEST_F(BoundaryHinterTest, WordWrapDisabledReturnsInput) {
    config.wordWrapEnabled = false;
    BoundaryHinter hinter(config, &tokenizer);
    const std::string text = reflow_test::thaiScenarioText();

    EXPECT_FALSE(hinter.isEnabled());
    EXPECT_EQ(hinter.hint(text, "th"), text);
    EXPECT_EQ(tokenizer.calls, 0);
}

TEST_F(BoundaryHinterTest, MissingTokenizerReturnsInput) {
    BoundaryHinter hinter(config, nullptr);
    const std::string text = reflow_test::thaiScenarioText();

    EXPECT_FALSE(hinter.isEnabled());
    EXPECT_EQ(hinter.hint(text, "th"), text);
}

TEST_F(BoundaryHinterTest, SpaceDelimitedLanguageUnchanged) {
    BoundaryHinter hinter(config, &tokenizer);
    const std::string text = "The quick brown fox jumps over the lazy dog";

    EXPECT_EQ(hinter.hint(text, "en"), text);
    EXPECT_EQ(hinter.hint(text, "fr-FR"), text);
    EXPECT_EQ(tokenizer.calls, 0);
}

TEST_F(BoundaryHinterTest, OnlyTheLanguageScriptIsHinted) {
    BoundaryHinter hinter(config, &tokenizer);
    const std::string text = reflow_test::thaiScenarioText();

    // Lao target: Thai characters are not its script
    EXPECT_EQ(hinter.hint(text, "lo"), text);
    EXPECT_EQ(tokenizer.calls, 0);

    EXPECT_NE(hinter.hint(text, "th-TH"), text);
}

TEST_F(BoundaryHinterTest, TokenizerFailureLeavesRunUnhinted) {
    tokenizer.failing = true;
    BoundaryHinter hinter(config, &tokenizer);
    const std::string text = reflow_test::thaiScenarioText();

    std::size_t inserted = 99;
    EXPECT_EQ(hinter.hint(text, "th", &inserted), text);
    EXPECT_EQ(inserted, 0u);
}

TEST_F(BoundaryHinterTest, NonReconstructingTokensRejected) {
    tokenizer.corrupt = true;
    BoundaryHinter hinter(config, &tokenizer);
    const std::string text = reflow_test::thaiScenarioText();

    EXPECT_EQ(hinter.hint(text, "th"), text);
}

TEST(BoundaryMarkerTest, StripAndDetect) {
    const std::string text = "a" + kMarker + "b" + kMarker + kMarker + "c";
    EXPECT_TRUE(containsMarker(text));
    EXPECT_EQ(stripMarkers(text), "abc");
    EXPECT_FALSE(containsMarker("abc"));
    EXPECT_EQ(stripMarkers(""), "");
}

TEST(BoundaryMarkerTest, HintedScriptLookup) {
    EXPECT_EQ(hintedScriptFor("th"), CodePointScript::Thai);
    EXPECT_EQ(hintedScriptFor("TH_th"), CodePointScript::Thai);
    EXPECT_EQ(hintedScriptFor("lo"), CodePointScript::Lao);
    EXPECT_EQ(hintedScriptFor("km"), CodePointScript::Khmer);
    EXPECT_EQ(hintedScriptFor("my"), CodePointScript::Myanmar);
    EXPECT_EQ(hintedScriptFor("ja"), CodePointScript::Common);
    EXPECT_EQ(hintedScriptFor("en"), CodePointScript::Common);
}

// =============================================================================
// ICU tokenizer
// =============================================================================

class IcuTokenizerTest : public ::testing::Test {
protected:
    std::unique_ptr<IcuWordTokenizer> tokenizer;

    void SetUp() override {
        tokenizer = IcuWordTokenizer::create("th");
        if (!tokenizer) {
            GTEST_SKIP() << "ICU break iterators unavailable";
        }
    }
};

TEST_F(IcuTokenizerTest, SegmentsThaiIntoWords) {
    const std::string text = reflow_test::thaiScenarioText();

    for (TokenizerEngine engine : {TokenizerEngine::Dictionary, TokenizerEngine::LineBreak}) {
        std::vector<std::string> tokens;
        ASSERT_TRUE(tokenizer->tokenize(text, engine, tokens));
        EXPECT_GE(tokens.size(), 2u);

        std::string joined;
        for (const std::string& token : tokens) {
            EXPECT_FALSE(token.empty());
            joined += token;
        }
        EXPECT_EQ(joined, text);
    }
}

TEST_F(IcuTokenizerTest, EmptyInput) {
    std::vector<std::string> tokens = {"stale"};
    EXPECT_TRUE(tokenizer->tokenize("", TokenizerEngine::Dictionary, tokens));
    EXPECT_TRUE(tokens.empty());
}

TEST_F(IcuTokenizerTest, HinterWithIcu) {
    ShapingConfiguration config;
    BoundaryHinter hinter(config, tokenizer.get());
    const std::string text = reflow_test::thaiScenarioText();

    const std::string hinted = hinter.hint(text, "th");
    EXPECT_TRUE(containsMarker(hinted));
    EXPECT_EQ(stripMarkers(hinted), text);
    EXPECT_FALSE(startsOrEndsWithMarker(hinted));
    EXPECT_EQ(hinter.hint(hinted, "th"), hinted);
}
