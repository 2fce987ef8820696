#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>

#include "emb/LibraryEmbedder.hpp"
#include "emb/WordPieceTokenizer.hpp"

#include "Fakes.hpp"

namespace {

// Dimension 3 for ordinary titles; titles containing a marker word misbehave.
class ScriptedEmbedder final : public emb::TextEmbedder {
public:
    std::vector<float> embed(const std::string& text, size_t) const override {
        if (text.find("Broken") != std::string::npos) throw std::runtime_error("session failed");
        if (text.find("Blank") != std::string::npos) return {};
        if (text.find("Wide") != std::string::npos) return {0.5f, 0.5f, 0.5f, 0.5f};
        return {1.0f, 0.0f, 0.0f};
    }
};

}  // namespace

TEST(LibraryEmbedder, TextCarriesEveryPresentSectionInOrder) {
    store::MediaItem m = fakes::movie("m1", "Heat", {"Crime", "Thriller"}, "", 1995);
    m.content_rating = "R";
    m.directors = {"Michael Mann"};
    m.studios = {"Warner Bros.", "Regency", "Forward Pass"};
    m.actors = {store::Person{"Al Pacino"}, store::Person{"Robert De Niro"}, store::Person{"Val Kilmer"},
                store::Person{"Jon Voight"}};
    m.overview = "A cop hunts a crew of thieves";
    m.keywords = {"heist", "los angeles"};

    EXPECT_EQ(emb::item_embedding_text(m),
              "Heat (1995). Genres: Crime, Thriller. Rated R. Directed by Michael Mann. "
              "Studio: Warner Bros., Regency. Starring Al Pacino, Robert De Niro, Val Kilmer. "
              "A cop hunts a crew of thieves. Themes: heist, los angeles");
}

TEST(LibraryEmbedder, SparseItemsAndLongOverviews) {
    store::MediaItem bare;
    bare.id = "x";
    bare.title = "Untitled";
    EXPECT_EQ(emb::item_embedding_text(bare), "Untitled");

    store::MediaItem s = fakes::series("s1", "The Wire", {"Drama"}, "HBO");
    s.overview = std::string(1200, 'a');
    const std::string text = emb::item_embedding_text(s);
    EXPECT_NE(text.find("Network: HBO"), std::string::npos);
    EXPECT_NE(text.find(std::string(1000, 'a') + "..."), std::string::npos);
    EXPECT_EQ(text.find(std::string(1001, 'a')), std::string::npos);
}

TEST(LibraryEmbedder, SkipsItemsThatCannotBeEmbedded) {
    std::vector<store::MediaItem> items{
        fakes::movie("a", "Alpha"),
        fakes::movie("b", "Broken Arrow"),
        fakes::movie("c", "Blank Check"),
        fakes::movie("d", "Wide Awake"),
        fakes::movie("e", "Echo"),
    };

    ScriptedEmbedder embedder;
    jobs::RecordingProgressReporter rep;
    emb::EmbedStats stats;
    auto idx = emb::embed_library(items, embedder, rep, &stats);

    EXPECT_EQ(stats.embedded, 2u);
    EXPECT_EQ(stats.skipped, 3u);
    EXPECT_EQ(idx.size(), 2u);
    EXPECT_EQ(idx.dim(), 3u);
    EXPECT_TRUE(idx.get_vector("a").has_value());
    EXPECT_TRUE(idx.get_vector("e").has_value());
    EXPECT_FALSE(idx.get_vector("d").has_value());
    EXPECT_GE(rep.count_at_least(jobs::LogLevel::Warn), 1u);
}

TEST(LibraryEmbedder, StopRequestInterruptsEmbedding) {
    ScriptedEmbedder embedder;
    jobs::NullProgressReporter rep;
    jobs::StopToken stop;
    stop.request_stop();
    EXPECT_THROW(emb::embed_library({fakes::movie("a", "Alpha")}, embedder, rep, nullptr, stop), std::runtime_error);
}

class WordPieceTest : public ::testing::Test {
protected:
    void SetUp() override {
        path = std::filesystem::temp_directory_path() / "media_recs_vocab.txt";
        std::ofstream out(path);
        for (const char* t : {"[PAD]", "[UNK]", "[CLS]", "[SEP]", "the", "dark", "knight", "##s", ".", "un", "##related"}) {
            out << t << "\n";
        }
        out.close();
        ASSERT_TRUE(tok.load_vocab(path.string()));
    }

    void TearDown() override { std::filesystem::remove(path); }

    std::filesystem::path path;
    emb::WordPieceTokenizer tok;
};

TEST_F(WordPieceTest, SplitsWordsIntoPiecesBetweenSpecialTokens) {
    EXPECT_EQ(tok.vocab_size(), 11u);
    EXPECT_EQ(tok.encode("The DARK Knights.", 16), (std::vector<int64_t>{2, 4, 5, 6, 7, 8, 3}));
    EXPECT_EQ(tok.encode("unrelated", 16), (std::vector<int64_t>{2, 9, 10, 3}));
    EXPECT_EQ(tok.encode("xyz", 16), (std::vector<int64_t>{2, 1, 3}));
}

TEST_F(WordPieceTest, NeverExceedsMaxLength) {
    EXPECT_EQ(tok.encode("the dark knights", 5), (std::vector<int64_t>{2, 4, 5, 6, 3}));
    EXPECT_EQ(tok.encode("the dark knight the dark knight", 4).size(), 4u);
    EXPECT_EQ(tok.encode("the", 0), (std::vector<int64_t>{2, 3}));
}

TEST(WordPiece, VocabWithoutSpecialTokensIsRejected) {
    const auto path = std::filesystem::temp_directory_path() / "media_recs_vocab_bad.txt";
    {
        std::ofstream out(path);
        out << "the\ndark\n";
    }
    emb::WordPieceTokenizer tok;
    EXPECT_FALSE(tok.load_vocab(path.string()));
    EXPECT_FALSE(tok.load_vocab((path.string() + ".missing")));
    std::filesystem::remove(path);
}
