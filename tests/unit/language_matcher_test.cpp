#include <gtest/gtest.h>

#include "models/language_matcher.h"

using namespace modelcat;

TEST(LanguageMatcherTest, OrderPutsDefaultFirstKeepingTheRest) {
    const std::vector<std::string> codes{"EN", "FR", "DE"};
    EXPECT_EQ(orderLanguageCodes(codes, "FR"), (std::vector<std::string>{"FR", "EN", "DE"}));
    EXPECT_EQ(orderLanguageCodes(codes, "DE"), (std::vector<std::string>{"DE", "EN", "FR"}));
    EXPECT_EQ(orderLanguageCodes(codes, "EN"), codes);
}

TEST(LanguageMatcherTest, OrderUnchangedWhenDefaultUnknown) {
    const std::vector<std::string> codes{"EN", "FR"};
    EXPECT_EQ(orderLanguageCodes(codes, "JA"), codes);
    EXPECT_EQ(orderLanguageCodes(codes, ""), codes);
    EXPECT_TRUE(orderLanguageCodes({}, "EN").empty());
}

TEST(LanguageMatcherTest, ExactMatchIgnoresCaseAndUnderscore) {
    LanguageMatcher m({"EN", "fr_CA", "FR"});

    auto r = m.match({"fr-ca"});
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->code, "fr_CA");
    EXPECT_EQ(r->index, 1u);
    EXPECT_TRUE(r->exact);

    r = m.match({"Fr"});
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->code, "FR");
    EXPECT_TRUE(r->exact);
}

TEST(LanguageMatcherTest, BaseLanguageMatchWhenNoExact) {
    LanguageMatcher m({"EN", "FR"});

    auto r = m.match({"de-DE", "fr-BE"});
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->code, "FR");
    EXPECT_FALSE(r->exact);
}

TEST(LanguageMatcherTest, ExactMatchOfLaterTagWinsOverBaseMatchOfEarlierTag) {
    LanguageMatcher m({"EN", "fr-FR", "de"});
    auto r = m.match({"fr-CA", "de"});
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->code, "de");
    EXPECT_TRUE(r->exact);
}

TEST(LanguageMatcherTest, FallsBackToDefault) {
    LanguageMatcher m({"FR", "EN"});

    auto r = m.match({"ja", "ko"});
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->code, "FR");
    EXPECT_EQ(r->index, 0u);

    r = m.match({});
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->code, "FR");
}

TEST(LanguageMatcherTest, EmptyMatcherHasNoMatch) {
    LanguageMatcher m;
    EXPECT_TRUE(m.empty());
    EXPECT_FALSE(m.match({"en"}).has_value());
}

TEST(LanguageMatcherTest, ParseAcceptLanguageOrdersByQuality) {
    auto tags = parseAcceptLanguage("fr-CH, fr;q=0.9, en;q=0.8, de;q=0.7, *;q=0.5");
    EXPECT_EQ(tags, (std::vector<std::string>{"fr-CH", "fr", "en", "de"}));

    tags = parseAcceptLanguage("en;q=0.5, de, fr;q=0.9");
    EXPECT_EQ(tags, (std::vector<std::string>{"de", "fr", "en"}));
}

TEST(LanguageMatcherTest, ParseAcceptLanguageKeepsOrderOfEqualQuality) {
    auto tags = parseAcceptLanguage("ru;q=0.5, ja;q=0.5, ko;q=0.5");
    EXPECT_EQ(tags, (std::vector<std::string>{"ru", "ja", "ko"}));
}

TEST(LanguageMatcherTest, ParseAcceptLanguageDropsZeroQualityAndBlanks) {
    auto tags = parseAcceptLanguage(" , en;q=0, fr ,, *");
    EXPECT_EQ(tags, (std::vector<std::string>{"fr"}));
    EXPECT_TRUE(parseAcceptLanguage("").empty());
}
