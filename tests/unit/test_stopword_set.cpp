#include <gtest/gtest.h>
#include "text/StopwordSet.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace kwe;

TEST(StopwordSetTest, EnglishDefaults) {
    StopwordSet s = StopwordSet::english();
    EXPECT_TRUE(s.contains("the"));
    EXPECT_TRUE(s.contains("The"));
    EXPECT_TRUE(s.contains("don't"));
    EXPECT_FALSE(s.contains("keyword"));
    EXPECT_EQ(s.size(), 179u);
}

TEST(StopwordSetTest, FromWordsNormalizes) {
    StopwordSet s = StopwordSet::from_words({"  Can ", "BE", "", "   "});
    EXPECT_EQ(s.size(), 2u);
    EXPECT_TRUE(s.contains("can"));
    EXPECT_TRUE(s.contains("be"));
    EXPECT_FALSE(s.contains(""));
}

TEST(StopwordSetTest, DefaultConstructedIsEmpty) {
    StopwordSet s;
    EXPECT_TRUE(s.empty());
    EXPECT_FALSE(s.contains("the"));
}

TEST(StopwordSetTest, LoadFromFile) {
    const auto path = std::filesystem::temp_directory_path() / "kwe_stopwords_test.txt";
    {
        std::ofstream out(path);
        out << "# custom list\n"
            << "alpha\n"
            << "\n"
            << "  Beta  \n";
    }

    StopwordSet s = StopwordSet::load_from_file(path.string());
    EXPECT_EQ(s.size(), 2u);
    EXPECT_TRUE(s.contains("alpha"));
    EXPECT_TRUE(s.contains("beta"));
    EXPECT_FALSE(s.contains("# custom list"));

    std::filesystem::remove(path);
}

TEST(StopwordSetTest, MissingFileThrows) {
    EXPECT_THROW(StopwordSet::load_from_file("/nonexistent/kwe/stopwords.txt"), std::runtime_error);
}
