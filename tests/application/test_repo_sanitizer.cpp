#include "sanitizer/application/repo_sanitizer.hpp"
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <ctime>

namespace sanitizer {

using ::testing::_;
using ::testing::HasSubstr;
using ::testing::InSequence;
using ::testing::Return;
using ::testing::StartsWith;
using ::testing::Throw;

class MockFileSystem : public IFileSystem {
public:
    MOCK_METHOD(std::optional<std::string>, read_file, (const std::string&), (override));
    MOCK_METHOD(bool, write_file, (const std::string&, const std::string&), (override));
    MOCK_METHOD(bool, remove_file, (const std::string&), (override));
    MOCK_METHOD(bool, file_exists, (const std::string&), (override));
    MOCK_METHOD(std::optional<std::string>, make_temp_directory, (), (override));
    MOCK_METHOD(bool, remove_directory, (const std::string&), (override));
};

class MockVersionControl : public IVersionControl {
public:
    MOCK_METHOD(bool, is_clean, (const std::string&), (override));
    MOCK_METHOD(std::vector<std::string>, list_tracked_files, (const std::string&), (override));
    MOCK_METHOD(std::string, current_branch, (const std::string&), (override));
    MOCK_METHOD(bool, branch_exists, (const std::string&, const std::string&), (override));
    MOCK_METHOD(void, clone, (const std::string&, const std::string&), (override));
    MOCK_METHOD(void, fetch_branch,
                (const std::string&, const std::string&, const std::string&, const std::string&),
                (override));
    MOCK_METHOD(void, point_head_at, (const std::string&, const std::string&), (override));
    MOCK_METHOD(CommitStatus, commit_all, (const std::string&, const std::string&, bool),
                (override));
    MOCK_METHOD(void, create_branch, (const std::string&, const std::string&, const std::string&),
                (override));
};

class RepoSanitizerTest : public ::testing::Test {
protected:
    void SetUp() override {
        options_.repo_root = "/repo";
        ON_CALL(vcs_, is_clean(_)).WillByDefault(Return(true));
    }

    // Tracked files of the repository under /repo
    void given_files(const std::vector<std::pair<std::string, std::string>>& files) {
        std::vector<std::string> paths;
        for (const auto& [path, content] : files) {
            paths.push_back(path);
            ON_CALL(filesystem_, read_file("/repo/" + path))
                .WillByDefault(Return(std::optional<std::string>(content)));
        }
        ON_CALL(vcs_, list_tracked_files("/repo")).WillByDefault(Return(paths));
    }

    const std::string solution_ =
        "int answer() {\n"
        "    // REPOBEE-SANITIZER-START\n"
        "    // return 42;\n"
        "    // REPOBEE-SANITIZER-REPLACE-WITH\n"
        "    // return 0;\n"
        "    // REPOBEE-SANITIZER-END\n"
        "}\n";
    const std::string sanitized_ = "int answer() {\nreturn 0;\n}\n";
    const std::string broken_ = "a\n# REPOBEE-SANITIZER-END\n";

    ::testing::NiceMock<MockFileSystem> filesystem_;
    ::testing::NiceMock<MockVersionControl> vcs_;
    RepoOptions options_;
};

TEST_F(RepoSanitizerTest, DirtyWorkingTreeStops)
{
    EXPECT_CALL(vcs_, is_clean("/repo")).WillOnce(Return(false));
    EXPECT_CALL(vcs_, list_tracked_files(_)).Times(0);

    auto report = RepoSanitizer(filesystem_, vcs_).run(options_);

    EXPECT_EQ(report.status, RepoStatus::DIRTY_WORKING_TREE);
    EXPECT_THAT(report.message, HasSubstr("uncommitted changes"));
}

TEST_F(RepoSanitizerTest, ForceSkipsCleanCheck)
{
    given_files({{"Answer.java", solution_}});
    options_.force = true;

    EXPECT_CALL(vcs_, is_clean(_)).Times(0);
    EXPECT_CALL(filesystem_, write_file("/repo/Answer.java", sanitized_)).WillOnce(Return(true));

    auto report = RepoSanitizer(filesystem_, vcs_).run(options_);

    EXPECT_EQ(report.status, RepoStatus::SANITIZED);
}

TEST_F(RepoSanitizerTest, RewritesDirtyFilesInPlace)
{
    given_files({{"Answer.java", solution_},
                 {"README.md", "no markers here\n"},
                 {"Hidden.java", "// REPOBEE-SANITIZER-SHRED\nclass Hidden {}\n"}});

    EXPECT_CALL(filesystem_, write_file("/repo/Answer.java", sanitized_)).WillOnce(Return(true));
    EXPECT_CALL(filesystem_, write_file("/repo/README.md", _)).Times(0);
    EXPECT_CALL(filesystem_, remove_file("/repo/Hidden.java")).WillOnce(Return(true));

    auto report = RepoSanitizer(filesystem_, vcs_).run(options_);

    EXPECT_EQ(report.status, RepoStatus::SANITIZED);
    EXPECT_EQ(report.rewritten, (std::vector<std::string>{"Answer.java"}));
    EXPECT_EQ(report.shredded, (std::vector<std::string>{"Hidden.java"}));
    EXPECT_TRUE(report.committed_branch.empty());
}

TEST_F(RepoSanitizerTest, BinaryFilesAreSkipped)
{
    given_files({{"logo.png", std::string("\x89PNG\0REPOBEE-SANITIZER-END", 26)}});

    EXPECT_CALL(filesystem_, write_file(_, _)).Times(0);

    auto report = RepoSanitizer(filesystem_, vcs_).run(options_);

    EXPECT_EQ(report.status, RepoStatus::NOTHING_TO_DO);
}

TEST_F(RepoSanitizerTest, SyntaxErrorsBlockEveryWrite)
{
    given_files({{"Answer.java", solution_}, {"broken.py", broken_}});

    EXPECT_CALL(filesystem_, write_file(_, _)).Times(0);
    EXPECT_CALL(filesystem_, remove_file(_)).Times(0);

    auto report = RepoSanitizer(filesystem_, vcs_).run(options_);

    EXPECT_EQ(report.status, RepoStatus::SYNTAX_ERRORS);
    ASSERT_EQ(report.files_with_errors.size(), 1);
    EXPECT_EQ(report.files_with_errors[0].relative_path, "broken.py");
    ASSERT_EQ(report.files_with_errors[0].errors.size(), 1);
    EXPECT_EQ(report.files_with_errors[0].errors[0].line_number, 2);
    EXPECT_TRUE(report.rewritten.empty());
}

TEST_F(RepoSanitizerTest, SyntaxErrorsBlockTheCommit)
{
    given_files({{"broken.py", broken_}});
    options_.target_branch = "template";

    EXPECT_CALL(vcs_, clone(_, _)).Times(0);
    EXPECT_CALL(vcs_, commit_all(_, _, _)).Times(0);

    auto report = RepoSanitizer(filesystem_, vcs_).run(options_);

    EXPECT_EQ(report.status, RepoStatus::SYNTAX_ERRORS);
}

TEST_F(RepoSanitizerTest, DryRunWritesNothing)
{
    given_files({{"Answer.java", solution_}, {"Hidden.java", "REPOBEE-SANITIZER-SHRED\n"}});
    options_.dry_run = true;

    EXPECT_CALL(filesystem_, write_file(_, _)).Times(0);
    EXPECT_CALL(filesystem_, remove_file(_)).Times(0);

    auto report = RepoSanitizer(filesystem_, vcs_).run(options_);

    EXPECT_EQ(report.status, RepoStatus::DRY_RUN);
    EXPECT_EQ(report.rewritten, (std::vector<std::string>{"Answer.java"}));
    EXPECT_EQ(report.shredded, (std::vector<std::string>{"Hidden.java"}));
}

TEST_F(RepoSanitizerTest, NothingToDoWithoutMarkers)
{
    given_files({{"README.md", "hello\n"}});

    auto report = RepoSanitizer(filesystem_, vcs_).run(options_);

    EXPECT_EQ(report.status, RepoStatus::NOTHING_TO_DO);
    EXPECT_EQ(report.message, "No files contain sanitizer markers");
}

TEST_F(RepoSanitizerTest, FileListReplacesTrackedFiles)
{
    options_.file_list = "/lists/files.txt";
    EXPECT_CALL(vcs_, list_tracked_files(_)).Times(0);
    EXPECT_CALL(filesystem_, file_exists("/lists/files.txt")).WillOnce(Return(true));
    EXPECT_CALL(filesystem_, read_file("/lists/files.txt"))
        .WillOnce(Return(std::optional<std::string>("Answer.java\n\n  sub/Other.java \n")));
    EXPECT_CALL(filesystem_, read_file("/repo/Answer.java"))
        .WillOnce(Return(std::optional<std::string>(solution_)));
    EXPECT_CALL(filesystem_, read_file("/repo/sub/Other.java"))
        .WillOnce(Return(std::optional<std::string>(solution_)));
    EXPECT_CALL(filesystem_, write_file(_, sanitized_)).Times(2).WillRepeatedly(Return(true));

    auto report = RepoSanitizer(filesystem_, vcs_).run(options_);

    EXPECT_EQ(report.status, RepoStatus::SANITIZED);
    EXPECT_EQ(report.rewritten, (std::vector<std::string>{"Answer.java", "sub/Other.java"}));
}

TEST_F(RepoSanitizerTest, MissingFileListFails)
{
    options_.file_list = "/lists/missing.txt";
    EXPECT_CALL(filesystem_, file_exists("/lists/missing.txt")).WillOnce(Return(false));
    EXPECT_CALL(filesystem_, read_file(_)).Times(0);

    auto report = RepoSanitizer(filesystem_, vcs_).run(options_);

    EXPECT_EQ(report.status, RepoStatus::FAILED);
    EXPECT_EQ(report.message, "No such file: /lists/missing.txt");
}

TEST_F(RepoSanitizerTest, UnreadableFileListFails)
{
    options_.file_list = "/lists/locked.txt";
    EXPECT_CALL(filesystem_, file_exists("/lists/locked.txt")).WillOnce(Return(true));
    EXPECT_CALL(filesystem_, read_file("/lists/locked.txt")).WillOnce(Return(std::nullopt));

    auto report = RepoSanitizer(filesystem_, vcs_).run(options_);

    EXPECT_EQ(report.status, RepoStatus::FAILED);
    EXPECT_EQ(report.message, "Could not read /lists/locked.txt");
}

TEST_F(RepoSanitizerTest, UnreadableFileFails)
{
    ON_CALL(vcs_, list_tracked_files("/repo"))
        .WillByDefault(Return(std::vector<std::string>{"gone.txt"}));
    EXPECT_CALL(filesystem_, read_file("/repo/gone.txt")).WillOnce(Return(std::nullopt));

    auto report = RepoSanitizer(filesystem_, vcs_).run(options_);

    EXPECT_EQ(report.status, RepoStatus::FAILED);
    EXPECT_EQ(report.message, "Could not read gone.txt");
}

TEST_F(RepoSanitizerTest, WriteFailureIsReported)
{
    given_files({{"Answer.java", solution_}});
    EXPECT_CALL(filesystem_, write_file(_, _)).WillOnce(Return(false));

    auto report = RepoSanitizer(filesystem_, vcs_).run(options_);

    EXPECT_EQ(report.status, RepoStatus::FAILED);
    EXPECT_EQ(report.message, "Could not write Answer.java");
}

TEST_F(RepoSanitizerTest, PartialWriteNamesChangedFiles)
{
    given_files({{"A.java", solution_},
                 {"B.java", "REPOBEE-SANITIZER-SHRED\n"},
                 {"C.java", solution_}});

    EXPECT_CALL(filesystem_, write_file("/repo/A.java", _)).WillOnce(Return(true));
    EXPECT_CALL(filesystem_, remove_file("/repo/B.java")).WillOnce(Return(true));
    EXPECT_CALL(filesystem_, write_file("/repo/C.java", _)).WillOnce(Return(false));

    auto report = RepoSanitizer(filesystem_, vcs_).run(options_);

    EXPECT_EQ(report.status, RepoStatus::FAILED);
    EXPECT_EQ(report.message, "Could not write C.java; already changed: A.java, B.java");
}

TEST_F(RepoSanitizerTest, DeleteFailureIsReported)
{
    given_files({{"B.java", "REPOBEE-SANITIZER-SHRED\n"}});
    EXPECT_CALL(filesystem_, remove_file("/repo/B.java")).WillOnce(Return(false));

    auto report = RepoSanitizer(filesystem_, vcs_).run(options_);

    EXPECT_EQ(report.status, RepoStatus::FAILED);
    EXPECT_EQ(report.message, "Could not delete B.java");
}

TEST_F(RepoSanitizerTest, CloneWriteFailureDoesNotListChangedFiles)
{
    given_files({{"A.java", solution_}, {"C.java", solution_}});
    options_.target_branch = "template";

    ON_CALL(vcs_, current_branch(_)).WillByDefault(Return("solution"));
    ON_CALL(filesystem_, make_temp_directory())
        .WillByDefault(Return(std::optional<std::string>("/tmp/s")));
    ON_CALL(filesystem_, remove_directory(_)).WillByDefault(Return(true));
    EXPECT_CALL(filesystem_, write_file("/tmp/s/repo/A.java", _)).WillOnce(Return(true));
    EXPECT_CALL(filesystem_, write_file("/tmp/s/repo/C.java", _)).WillOnce(Return(false));
    EXPECT_CALL(vcs_, commit_all(_, _, _)).Times(0);

    auto report = RepoSanitizer(filesystem_, vcs_).run(options_);

    EXPECT_EQ(report.status, RepoStatus::FAILED);
    EXPECT_EQ(report.message, "Could not write C.java");
}

TEST_F(RepoSanitizerTest, CommitsToTargetBranchThroughClone)
{
    given_files({{"Answer.java", solution_}});
    options_.target_branch = "template";
    options_.commit_message = "Sanitize";

    {
        InSequence sequence;
        EXPECT_CALL(vcs_, current_branch("/repo")).WillOnce(Return("solution"));
        EXPECT_CALL(filesystem_, make_temp_directory())
            .WillOnce(Return(std::optional<std::string>("/tmp/s")));
        EXPECT_CALL(vcs_, clone("/repo", "/tmp/s/repo"));
        EXPECT_CALL(vcs_, branch_exists("/repo", "template")).WillOnce(Return(true));
        EXPECT_CALL(vcs_, fetch_branch("/repo", "template", "/tmp/s/repo", "template"));
        EXPECT_CALL(vcs_, point_head_at("/tmp/s/repo", "template"));
        EXPECT_CALL(filesystem_, write_file("/tmp/s/repo/Answer.java", sanitized_))
            .WillOnce(Return(true));
        EXPECT_CALL(vcs_, commit_all("/tmp/s/repo", "Sanitize", false))
            .WillOnce(Return(CommitStatus::COMMITTED));
        EXPECT_CALL(vcs_, fetch_branch("/tmp/s/repo", "template", "/repo", "template"));
        EXPECT_CALL(filesystem_, remove_directory("/tmp/s")).WillOnce(Return(true));
    }
    EXPECT_CALL(filesystem_, write_file("/repo/Answer.java", _)).Times(0);
    EXPECT_CALL(vcs_, create_branch(_, _, _)).Times(0);

    auto report = RepoSanitizer(filesystem_, vcs_).run(options_);

    EXPECT_EQ(report.status, RepoStatus::SANITIZED);
    EXPECT_EQ(report.committed_branch, "template");
    EXPECT_TRUE(report.pr_branch.empty());
}

TEST_F(RepoSanitizerTest, NewTargetBranchIsNotFetched)
{
    given_files({{"Answer.java", solution_}});
    options_.target_branch = "template";

    ON_CALL(vcs_, current_branch(_)).WillByDefault(Return("solution"));
    ON_CALL(filesystem_, make_temp_directory())
        .WillByDefault(Return(std::optional<std::string>("/tmp/s")));
    ON_CALL(filesystem_, write_file(_, _)).WillByDefault(Return(true));
    ON_CALL(filesystem_, remove_directory(_)).WillByDefault(Return(true));
    ON_CALL(vcs_, commit_all(_, _, _)).WillByDefault(Return(CommitStatus::COMMITTED));

    EXPECT_CALL(vcs_, branch_exists("/repo", "template")).WillOnce(Return(false));
    EXPECT_CALL(vcs_, fetch_branch("/repo", _, _, _)).Times(0);
    EXPECT_CALL(vcs_, fetch_branch("/tmp/s/repo", "template", "/repo", "template"));

    auto report = RepoSanitizer(filesystem_, vcs_).run(options_);

    EXPECT_EQ(report.status, RepoStatus::SANITIZED);
}

TEST_F(RepoSanitizerTest, NothingToCommitFailsUnlessForced)
{
    given_files({{"Answer.java", solution_}});
    options_.target_branch = "template";

    ON_CALL(vcs_, current_branch(_)).WillByDefault(Return("solution"));
    ON_CALL(filesystem_, make_temp_directory())
        .WillByDefault(Return(std::optional<std::string>("/tmp/s")));
    ON_CALL(filesystem_, write_file(_, _)).WillByDefault(Return(true));
    ON_CALL(filesystem_, remove_directory(_)).WillByDefault(Return(true));

    EXPECT_CALL(vcs_, commit_all(_, _, false)).WillOnce(Return(CommitStatus::NOTHING_TO_COMMIT));
    EXPECT_CALL(vcs_, fetch_branch("/tmp/s/repo", _, _, _)).Times(0);
    EXPECT_CALL(filesystem_, remove_directory("/tmp/s")).WillOnce(Return(true));

    auto report = RepoSanitizer(filesystem_, vcs_).run(options_);

    EXPECT_EQ(report.status, RepoStatus::FAILED);
    EXPECT_THAT(report.message, HasSubstr("Nothing to commit on branch 'template'"));
}

TEST_F(RepoSanitizerTest, ForceAllowsEmptyCommit)
{
    given_files({{"Answer.java", solution_}});
    options_.target_branch = "template";
    options_.force = true;

    ON_CALL(vcs_, current_branch(_)).WillByDefault(Return("solution"));
    ON_CALL(filesystem_, make_temp_directory())
        .WillByDefault(Return(std::optional<std::string>("/tmp/s")));
    ON_CALL(filesystem_, write_file(_, _)).WillByDefault(Return(true));
    ON_CALL(filesystem_, remove_directory(_)).WillByDefault(Return(true));

    EXPECT_CALL(vcs_, commit_all("/tmp/s/repo", DEFAULT_COMMIT_MESSAGE, true))
        .WillOnce(Return(CommitStatus::COMMITTED));

    auto report = RepoSanitizer(filesystem_, vcs_).run(options_);

    EXPECT_EQ(report.status, RepoStatus::SANITIZED);
}

TEST_F(RepoSanitizerTest, CreatesPullRequestBranch)
{
    given_files({{"Answer.java", solution_}});
    options_.target_branch = "template";
    options_.create_pr_branch = true;

    ON_CALL(vcs_, current_branch(_)).WillByDefault(Return("solution"));
    ON_CALL(filesystem_, make_temp_directory())
        .WillByDefault(Return(std::optional<std::string>("/tmp/s")));
    ON_CALL(filesystem_, write_file(_, _)).WillByDefault(Return(true));
    ON_CALL(filesystem_, remove_directory(_)).WillByDefault(Return(true));
    ON_CALL(vcs_, commit_all(_, _, _)).WillByDefault(Return(CommitStatus::COMMITTED));

    EXPECT_CALL(vcs_, create_branch("/repo", StartsWith("template-pr-"), "template"));

    auto report = RepoSanitizer(filesystem_, vcs_).run(options_);

    EXPECT_EQ(report.status, RepoStatus::SANITIZED);
    EXPECT_THAT(report.pr_branch, StartsWith("template-pr-"));
}

TEST_F(RepoSanitizerTest, PullRequestBranchNeedsTarget)
{
    options_.create_pr_branch = true;
    EXPECT_CALL(vcs_, is_clean(_)).Times(0);

    auto report = RepoSanitizer(filesystem_, vcs_).run(options_);

    EXPECT_EQ(report.status, RepoStatus::FAILED);
}

TEST_F(RepoSanitizerTest, TargetBranchMustNotBeCheckedOut)
{
    given_files({{"Answer.java", solution_}});
    options_.target_branch = "template";

    EXPECT_CALL(vcs_, current_branch("/repo")).WillOnce(Return("template"));
    EXPECT_CALL(vcs_, clone(_, _)).Times(0);

    auto report = RepoSanitizer(filesystem_, vcs_).run(options_);

    EXPECT_EQ(report.status, RepoStatus::FAILED);
    EXPECT_THAT(report.message, HasSubstr("is checked out"));
}

TEST_F(RepoSanitizerTest, VersionControlErrorBecomesFailure)
{
    given_files({{"Answer.java", solution_}});
    options_.target_branch = "template";

    ON_CALL(vcs_, current_branch(_)).WillByDefault(Return("solution"));
    ON_CALL(filesystem_, make_temp_directory())
        .WillByDefault(Return(std::optional<std::string>("/tmp/s")));
    EXPECT_CALL(vcs_, clone(_, _)).WillOnce(Throw(VcsError("git clone failed: boom")));
    EXPECT_CALL(filesystem_, remove_directory("/tmp/s")).WillOnce(Return(true));

    auto report = RepoSanitizer(filesystem_, vcs_).run(options_);

    EXPECT_EQ(report.status, RepoStatus::FAILED);
    EXPECT_EQ(report.message, "git clone failed: boom");
}

TEST_F(RepoSanitizerTest, SanitizeAllKeepsInputOrder)
{
    std::vector<std::pair<std::string, std::string>> files;
    for (int i = 0; i < 25; ++i) {
        auto content = i % 5 == 0 ? broken_ : solution_;
        files.emplace_back("file" + std::to_string(i), content);
    }

    auto results = RepoSanitizer::sanitize_all(files, Mode::SANITIZE, 4);

    ASSERT_EQ(results.size(), files.size());
    for (size_t i = 0; i < files.size(); ++i) {
        EXPECT_EQ(results[i].relative_path, files[i].first);
        EXPECT_EQ(has_errors(results[i].result), i % 5 == 0);
    }
}

TEST_F(RepoSanitizerTest, SanitizeAllOfNothing)
{
    EXPECT_TRUE(RepoSanitizer::sanitize_all({}, Mode::STRIP, 0).empty());
}

TEST_F(RepoSanitizerTest, PullRequestBranchName)
{
    std::tm local{};
    local.tm_year = 2024 - 1900;
    local.tm_mon = 4;
    local.tm_mday = 1;
    local.tm_hour = 13;
    local.tm_min = 45;
    local.tm_sec = 10;
    local.tm_isdst = -1;
    auto when = std::chrono::system_clock::from_time_t(std::mktime(&local));

    EXPECT_EQ(pr_branch_name("template", when), "template-pr-2024/05/01_13.45.10");
}

TEST_F(RepoSanitizerTest, JoinPath)
{
    EXPECT_EQ(join_path("/repo", "a/b.txt"), "/repo/a/b.txt");
    EXPECT_EQ(join_path("/repo/", "b.txt"), "/repo/b.txt");
}

} // namespace sanitizer
