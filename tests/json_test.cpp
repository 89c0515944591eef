#include <lilscript-cpp/json.hpp>
#include <lilscript-cpp/tex.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace lilscript_cpp;
using json = nlohmann::json;

TEST(Json, kinds_serialize_as_names) {
    EXPECT_EQ(json(SpanKind::inline_direction), "InlineDirection");
    EXPECT_EQ(json(ContainerKind::listener_dialogue), "ListenerDialogue");
}

TEST(Json, span) {
    const auto j = json(Span::emphasis("loud"));
    EXPECT_EQ(j, (json{{"kind", "Emphasis"}, {"contents", "loud"}}));
}

TEST(Json, container) {
    const auto c = Container{ContainerKind::sfx}.push(Span::normal("pouring"));
    const auto j = json(c);

    EXPECT_EQ(j["kind"], "Sfx");
    ASSERT_EQ(j["spans"].size(), 1u);
    EXPECT_EQ(j["spans"][0]["contents"], "pouring");
}

TEST(Json, word_count) {
    const auto j = json(WordCount{3, 1});
    EXPECT_EQ(j["spoken"], 3);
    EXPECT_EQ(j["unspoken"], 1);
    EXPECT_EQ(j["total"], 4);
    EXPECT_DOUBLE_EQ(j["density"].get<double>(), 0.75);
}

TEST(Json, word_count_without_words_has_null_density) {
    EXPECT_TRUE(json(WordCount::zero())["density"].is_null());
}

TEST(Json, series_entry) {
    EXPECT_EQ(json(SeriesEntry::parse("Evenings (Part 3)")),
              (json{{"title", "Evenings"}, {"part", 3}}));

    const auto empty = json(SeriesEntry{});
    EXPECT_TRUE(empty["title"].is_null());
    EXPECT_TRUE(empty["part"].is_null());
}

TEST(Json, character) {
    EXPECT_EQ(json(Character{"Lil", "the narrator"}),
              (json{{"name", "Lil"}, {"description", "the narrator"}}));
}

TEST(Json, export_script) {
    const auto text =
        "\\renewcommand{\\SceneName}{A Quiet Evening}\n"
        "\\scriptAuthor{lilellia}\n"
        "\\scriptSeries{—}\n"
        "\\scriptTags{[F4A][cozy]}\n"
        "\\summary{Two friends share tea.}\n"
        "\\clearpage\n"
        "\\spoken{Tea? \\direct{warmly}}\n";
    const auto j = export_json(parse_script(text));

    EXPECT_EQ(j["title"], "A Quiet Evening");
    EXPECT_EQ(j["author"], "lilellia");
    EXPECT_TRUE(j["series"]["title"].is_null());
    EXPECT_EQ(j["tags"], (json{"F4A", "cozy"}));
    EXPECT_TRUE(j["date"].is_null());
    EXPECT_EQ(j["summary"], "Two friends share tea.");
    EXPECT_TRUE(j["characters"].is_array());
    EXPECT_TRUE(j["characters"].empty());
    EXPECT_EQ(j["word_count"]["spoken"], 1);
    EXPECT_EQ(j["word_count"]["unspoken"], 1);

    ASSERT_EQ(j["paragraphs"].size(), 1u);
    EXPECT_EQ(j["paragraphs"][0]["kind"], "Spoken");
    EXPECT_EQ(j["paragraphs"][0]["spans"][1],
              (json{{"kind", "InlineDirection"}, {"contents", "warmly"}}));
}

TEST(Json, export_date_as_iso_string) {
    auto script = Script{};
    script.date = Date{std::chrono::year{2024}, std::chrono::month{11}, std::chrono::day{30}};
    EXPECT_EQ(export_json(script)["date"], "2024-11-30");
}
