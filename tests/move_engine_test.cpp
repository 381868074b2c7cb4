// File: move_engine_test.cpp
#include <filesystem>
#include <memory>
#include "errors.hpp"
#include "fake_debrid_service.h"
#include "move_engine.hpp"
#include "namespace_builder.hpp"
#include "sandbox.h"

class MoveEngineTest : public SandboxedTest
{
protected:
    void SetUp() override
    {
        SandboxedTest::SetUp();

        service_ = std::make_shared<FakeDebridService>();
        service_->addTorrent({"T1", "Some.Movie.2019", "h1", "downloaded",
                              {"https://rd.example/d/AAA", "https://rd.example/d/BBB"}, {}});
        service_->addTorrent({"T2", "Show.S01", "h2", "downloaded", {"https://rd.example/d/CCC"}, {}});

        client_ = std::make_unique<APIClient>(service_, "secret", RetryPolicy{0, std::chrono::milliseconds(0)});
        fetcher_ = std::make_unique<InventoryFetcher>(*client_);
        fetcher_->refresh(false, false, std::stop_token());

        path_ = sandboxPath("sorting.txt");
        ruleFile_ = std::make_unique<RuleFile>(path_);
        ruleFile_->ensureExists();
        rebuild();

        moves_ = std::make_unique<MoveEngine>(*ruleFile_, sync_, recorded_, mapping_, folders_, *fetcher_, *client_);
    }

    // Rebuilds the tables from the rule file as a fresh start would.
    void rebuild()
    {
        NamespaceBuilder builder(broken_, [](const RemoteItem &torrent)
                                 { return torrent; });
        BuildResult built = builder.build(ruleFile_->load(), fetcher_->torrents());
        folders_.replaceAll(built.folders);
        recorded_.replaceAll(built.recorded);
        mapping_.replaceAll(built.mapping);
    }

    std::optional<TreeEntry> find(const std::string &dir, const std::string &name) const
    {
        for (const auto &entry : folders_.children(VirtualPath::Folder(dir)))
        {
            if (entry.name == name)
                return entry;
        }
        return std::nullopt;
    }

    size_t linesStartingWith(const std::string &prefix) const
    {
        size_t count = 0;
        for (const auto &line : readLines(path_))
        {
            if (line.compare(0, prefix.size(), prefix) == 0)
                count++;
        }
        return count;
    }

    std::shared_ptr<FakeDebridService> service_;
    std::unique_ptr<APIClient> client_;
    std::unique_ptr<InventoryFetcher> fetcher_;
    std::string path_;
    std::unique_ptr<RuleFile> ruleFile_;
    SyncState sync_;
    BrokenJobSet broken_;
    MappingTable recorded_;
    MappingTable mapping_;
    FolderTable folders_;
    std::unique_ptr<MoveEngine> moves_;
};

TEST_F(MoveEngineTest, tablesStartFromTheRegexFolders)
{
    EXPECT_TRUE(find("/movies/Some.Movie.2019/", "AAA").has_value());
    EXPECT_TRUE(find("/shows/Show.S01/", "CCC").has_value());
}

TEST_F(MoveEngineTest, fileMoveWritesExactlyOneLine)
{
    auto entry = find("/movies/Some.Movie.2019/", "AAA");
    ASSERT_TRUE(entry.has_value());

    moves_->moveFile(*entry, VirtualPath::Folder("/movies/Some.Movie.2019/"), VirtualPath::Folder("/movies/mine/"), "first.mkv");
    EXPECT_EQ(1u, countLines(path_, "/Some.Movie.2019/AAA -> /movies/mine/first.mkv"));
    EXPECT_TRUE(sync_.rulesDirty);
    EXPECT_FALSE(sync_.moving);

    auto moved = find("/movies/mine/", "first.mkv");
    ASSERT_TRUE(moved.has_value());
    EXPECT_TRUE(moved->nameFromRule);
    EXPECT_FALSE(find("/movies/Some.Movie.2019/", "AAA").has_value());
    EXPECT_EQ("/movies/mine/first.mkv", *mapping_.load("/Some.Movie.2019/AAA"));

    moves_->moveFile(*moved, VirtualPath::Folder("/movies/mine/"), VirtualPath::Folder("/archive/"), "second.mkv");
    EXPECT_EQ(1u, linesStartingWith("/Some.Movie.2019/AAA -> "));
    EXPECT_EQ(1u, countLines(path_, "/Some.Movie.2019/AAA -> /archive/second.mkv"));
}

TEST_F(MoveEngineTest, fileMoveSurvivesARebuild)
{
    auto entry = find("/movies/Some.Movie.2019/", "BBB");
    ASSERT_TRUE(entry.has_value());
    moves_->moveFile(*entry, VirtualPath::Folder("/movies/Some.Movie.2019/"), VirtualPath::Folder("/movies/x/y/"), "renamed.mkv");

    rebuild();
    auto rebuilt = find("/movies/x/y/", "renamed.mkv");
    ASSERT_TRUE(rebuilt.has_value());
    EXPECT_EQ("BBB", rebuilt->id);
    EXPECT_TRUE(find("/movies/x/", "y").has_value());
    EXPECT_TRUE(find("/movies/Some.Movie.2019/", "AAA").has_value());
}

TEST_F(MoveEngineTest, jobFolderMoveUsesTheJobKey)
{
    moves_->moveFolder(VirtualPath::Folder("/movies/"), "Some.Movie.2019", VirtualPath::Folder("/archive/"), "Movie");

    EXPECT_EQ(1u, countLines(path_, "/Some.Movie.2019/ -> /archive/Movie/"));
    EXPECT_EQ(1u, countLines(path_, "/Some.Movie.2019/AAA -> /archive/Movie/"));
    EXPECT_EQ(1u, countLines(path_, "/Some.Movie.2019/BBB -> /archive/Movie/"));

    EXPECT_TRUE(find("/archive/Movie/", "AAA").has_value());
    EXPECT_TRUE(find("/archive/", "Movie").has_value());
    EXPECT_FALSE(find("/movies/", "Some.Movie.2019").has_value());

    rebuild();
    EXPECT_TRUE(find("/archive/Movie/", "AAA").has_value());
    EXPECT_TRUE(find("/archive/Movie/", "BBB").has_value());
    EXPECT_TRUE(folders_.children(VirtualPath::Folder("/movies/Some.Movie.2019/")).empty());
}

TEST_F(MoveEngineTest, plainFolderMoveCarriesItsContents)
{
    auto entry = find("/shows/Show.S01/", "CCC");
    ASSERT_TRUE(entry.has_value());
    moves_->moveFile(*entry, VirtualPath::Folder("/shows/Show.S01/"), VirtualPath::Folder("/shows/mine/season 1/"), "ep.mkv");

    moves_->moveFolder(VirtualPath::Folder("/shows/"), "mine", VirtualPath::Folder("/shows/"), "ours");

    EXPECT_EQ(1u, countLines(path_, "/Show.S01/CCC -> /shows/ours/season 1/ep.mkv"));
    EXPECT_EQ(1u, countLines(path_, "/shows/mine/ -> /shows/ours/"));
    EXPECT_TRUE(find("/shows/ours/season 1/", "ep.mkv").has_value());

    rebuild();
    EXPECT_TRUE(find("/shows/ours/season 1/", "ep.mkv").has_value());
}

TEST_F(MoveEngineTest, folderCannotMoveIntoItself)
{
    EXPECT_THROW(moves_->moveFolder(VirtualPath::Folder("/movies/"), "Some.Movie.2019",
                                    VirtualPath::Folder("/movies/Some.Movie.2019/"), "inner"),
                 RdfsError);
    EXPECT_FALSE(sync_.moving);
}

TEST_F(MoveEngineTest, trashingPartOfAJobKeepsIt)
{
    auto entry = find("/movies/Some.Movie.2019/", "AAA");
    ASSERT_TRUE(entry.has_value());

    moves_->remove(*entry, VirtualPath::Folder("/movies/Some.Movie.2019/"), std::stop_token());

    EXPECT_EQ(1u, countLines(path_, "/Some.Movie.2019/AAA -> /movies/Some.Movie.2019/AAA.trashed"));
    EXPECT_TRUE(find("/movies/Some.Movie.2019/", "AAA.trashed").has_value());
    EXPECT_EQ(0, service_->count("DELETE", "/torrents/delete/"));

    rebuild();
    EXPECT_FALSE(find("/movies/Some.Movie.2019/", "AAA").has_value());
    EXPECT_FALSE(find("/movies/Some.Movie.2019/", "AAA.trashed").has_value());
    EXPECT_TRUE(find("/movies/Some.Movie.2019/", "BBB").has_value());
}

TEST_F(MoveEngineTest, trashingTheLastFileDeletesTheJob)
{
    auto first = find("/movies/Some.Movie.2019/", "AAA");
    ASSERT_TRUE(first.has_value());
    moves_->remove(*first, VirtualPath::Folder("/movies/Some.Movie.2019/"), std::stop_token());

    auto second = find("/movies/Some.Movie.2019/", "BBB");
    ASSERT_TRUE(second.has_value());
    moves_->remove(*second, VirtualPath::Folder("/movies/Some.Movie.2019/"), std::stop_token());

    EXPECT_EQ(1, service_->count("DELETE", "/torrents/delete/T1"));
    EXPECT_FALSE(service_->hasTorrent("T1"));
    EXPECT_EQ(0u, linesStartingWith("/Some.Movie.2019/"));
    EXPECT_FALSE(recorded_.load("/Some.Movie.2019/AAA").has_value());
    EXPECT_FALSE(find("/movies/Some.Movie.2019/", "BBB").has_value());
    EXPECT_TRUE(fetcher_->intervalElapsed());
}

TEST_F(MoveEngineTest, failedTrashWriteDoesNotCountTowardsDeletingTheJob)
{
    VirtualPath dir = VirtualPath::Folder("/movies/Some.Movie.2019/");
    auto first = find(dir.str(), "AAA");
    auto second = find(dir.str(), "BBB");
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());

    // A directory in place of the sorting file makes every rewrite fail
    std::string saved = readFile(path_);
    std::filesystem::remove(path_);
    std::filesystem::create_directory(path_);
    EXPECT_THROW(moves_->remove(*first, dir, std::stop_token()), RuleFileError);
    EXPECT_FALSE(sync_.moving);
    EXPECT_FALSE(recorded_.load("/Some.Movie.2019/AAA").has_value());
    EXPECT_TRUE(find(dir.str(), "AAA").has_value());

    std::filesystem::remove(path_);
    writeFile(path_, saved);
    moves_->remove(*second, dir, std::stop_token());

    EXPECT_EQ(0, service_->count("DELETE", "/torrents/delete/T1"));
    EXPECT_TRUE(service_->hasTorrent("T1"));
    EXPECT_EQ(1u, countLines(path_, "/Some.Movie.2019/BBB -> /movies/Some.Movie.2019/BBB.trashed"));
    EXPECT_EQ(0u, linesStartingWith("/Some.Movie.2019/AAA"));
    EXPECT_TRUE(find(dir.str(), "AAA").has_value());
}

TEST_F(MoveEngineTest, singleFileJobIsDeletedAtOnce)
{
    auto entry = find("/shows/Show.S01/", "CCC");
    ASSERT_TRUE(entry.has_value());
    moves_->remove(*entry, VirtualPath::Folder("/shows/Show.S01/"), std::stop_token());

    EXPECT_FALSE(service_->hasTorrent("T2"));
    EXPECT_EQ(0u, linesStartingWith("/Show.S01/"));
}

TEST_F(MoveEngineTest, removingAnUnknownJobFails)
{
    TreeEntry ghost;
    ghost.name = "ghost";
    ghost.id = "ghost";
    ghost.parentId = "NOPE";
    ghost.mappingId = "/Ghost/ghost";
    EXPECT_THROW(moves_->remove(ghost, VirtualPath::Folder("/default/"), std::stop_token()), NotFoundError);
}

TEST_F(MoveEngineTest, createDirAppendsAFolderLine)
{
    EXPECT_THROW(moves_->createDir(VirtualPath::Root(), "top"), ReservedRootError);

    VirtualPath created = moves_->createDir(VirtualPath::Folder("/movies/"), "later");
    EXPECT_EQ("/movies/later/", created.str());
    EXPECT_EQ(1u, countLines(path_, "/movies/later/"));
    EXPECT_TRUE(folders_.contains(created));
    EXPECT_TRUE(find("/movies/", "later").has_value());

    rebuild();
    EXPECT_TRUE(find("/movies/", "later").has_value());
}

TEST_F(MoveEngineTest, bareFolderLineIsReplacedOnRename)
{
    moves_->createDir(VirtualPath::Folder("/movies/"), "later");
    moves_->moveFolder(VirtualPath::Folder("/movies/"), "later", VirtualPath::Folder("/movies/"), "sooner");

    EXPECT_EQ(0u, countLines(path_, "/movies/later/"));
    EXPECT_EQ(1u, countLines(path_, "/movies/sooner/"));
    EXPECT_TRUE(find("/movies/", "sooner").has_value());
    EXPECT_FALSE(find("/movies/", "later").has_value());
}

TEST_F(MoveEngineTest, handWrittenFolderLineWithoutSlashIsRewrittenInPlace)
{
    writeFile(path_, readFile(path_) + "/movies/later\n");
    rebuild();
    ASSERT_EQ("/movies/later", *recorded_.load("/movies/later"));

    moves_->moveFolder(VirtualPath::Folder("/movies/"), "later", VirtualPath::Folder("/movies/"), "sooner");

    EXPECT_EQ(0u, countLines(path_, "/movies/later"));
    EXPECT_EQ(0u, linesStartingWith("/movies/later/ -> "));
    EXPECT_EQ(0u, linesStartingWith("/movies/later -> "));
    EXPECT_EQ(1u, countLines(path_, "/movies/sooner/"));

    rebuild();
    EXPECT_TRUE(find("/movies/", "sooner").has_value());
    EXPECT_FALSE(find("/movies/", "later").has_value());
}
