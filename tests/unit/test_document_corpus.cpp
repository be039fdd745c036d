#include <gtest/gtest.h>
#include "corpus/DocumentCorpus.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;
using namespace kwe;

class DocumentCorpusTest : public ::testing::Test {
protected:
    fs::path dir;

    void SetUp() override {
        dir = fs::temp_directory_path() / "kwe_corpus_test";
        fs::remove_all(dir);
        fs::create_directories(dir);
        write("b.txt", "Second document.");
        write("a.txt", "First document.");
        write("notes.md", "Not part of the corpus.");
        fs::create_directories(dir / "nested.txt");
    }

    void TearDown() override {
        fs::remove_all(dir);
    }

    void write(const std::string& name, const std::string& text) {
        std::ofstream out(dir / name);
        out << text;
    }
};

TEST_F(DocumentCorpusTest, LoadsTextFilesSortedByName) {
    DocumentCorpus c = DocumentCorpus::load_from_dir(dir.string());
    ASSERT_EQ(c.size(), 2u);
    EXPECT_EQ(c.documents()[0].id, "a");
    EXPECT_EQ(c.documents()[1].id, "b");

    std::vector<std::string> expected = {"First document.", "Second document."};
    EXPECT_EQ(c.texts(), expected);
}

TEST_F(DocumentCorpusTest, CustomExtension) {
    DocumentCorpus c = DocumentCorpus::load_from_dir(dir.string(), ".md");
    ASSERT_EQ(c.size(), 1u);
    EXPECT_EQ(c.documents()[0].id, "notes");
}

TEST_F(DocumentCorpusTest, ExcludeRemovesTheTarget) {
    DocumentCorpus c = DocumentCorpus::load_from_dir(dir.string());
    c.exclude((dir / "." / "a.txt").string());
    ASSERT_EQ(c.size(), 1u);
    EXPECT_EQ(c.documents()[0].id, "b");

    c.exclude((dir / "missing.txt").string());
    EXPECT_EQ(c.size(), 1u);
}

TEST_F(DocumentCorpusTest, ReadTextFile) {
    EXPECT_EQ(read_text_file((dir / "a.txt").string()), "First document.");
    EXPECT_THROW(read_text_file((dir / "missing.txt").string()), std::runtime_error);
}

TEST_F(DocumentCorpusTest, MissingDirectoryThrows) {
    EXPECT_THROW(DocumentCorpus::load_from_dir((dir / "nope").string()), std::runtime_error);
    EXPECT_THROW(DocumentCorpus::load_from_dir((dir / "a.txt").string()), std::runtime_error);
}
