#include "gtest/gtest.h"
#include "common/tar.hpp"
#include "sandbox/archive.hpp"
#include "sandbox/sanitizer.hpp"

using namespace std;
using namespace sandbox;

class ArchiveTest : public ::testing::Test {
protected:
    vector<tar_member> entries(const string &archive) {
        vector<tar_member> members;
        read_tar(archive, [&](const tar_member &member) {
            members.push_back(member);
            return true;
        });
        return members;
    }

    runner_config config;
};

TEST_F(ArchiveTest, ContainsProgramAndShim) {
    string archive = build_archive("print('Hello')\n", {}, config);
    auto members = entries(archive);
    ASSERT_EQ(members.size(), 2);
    EXPECT_EQ(members[0].name, "main.py");
    EXPECT_EQ(members[0].content, "print('Hello')\n");
    EXPECT_EQ(members[1].name, "turtle.py");
    EXPECT_EQ(members[1].content, TURTLE_MODULE_SOURCE);
}

TEST_F(ArchiveTest, AuxiliaryFilesFollowInOrder) {
    auto files = sanitize_files({{"b.txt", "B"}, {"data/in/a.csv", "1,2\n"}, {"data/c.txt", "C"}}, config);
    auto members = entries(build_archive("pass", files, config));

    vector<string> names;
    for (auto &member : members) names.push_back(member.name);
    EXPECT_EQ(names, (vector<string>{"main.py", "turtle.py", "b.txt", "data/", "data/in/", "data/in/a.csv", "data/c.txt"}));
    EXPECT_EQ(members[5].content, "1,2\n");
    EXPECT_EQ(members[3].kind, tar_member::type::DIRECTORY);
}

TEST_F(ArchiveTest, OwnedByRunUser) {
    config.run_user = "1000:2000";
    string archive = build_archive("pass", {}, config);
    EXPECT_EQ(string(archive.data() + 108, 7), "0001750");
    EXPECT_EQ(string(archive.data() + 116, 7), "0003720");
}

TEST_F(ArchiveTest, Deterministic) {
    auto files = sanitize_files({{"x.txt", "x"}}, config);
    EXPECT_EQ(build_archive("print(1)", files, config), build_archive("print(1)", files, config));
}

TEST_F(ArchiveTest, ShimProvidesTurtleApi) {
    string shim = TURTLE_MODULE_SOURCE;
    for (const char *name : {"def forward(", "def backward(", "def left(", "def right(", "def penup(",
                             "def pendown(", "def goto(", "def setheading(", "def color(", "def pensize(",
                             "def circle(", "def done(", "def write_svg(", "class Turtle", "def Screen(",
                             "def bye(", "atexit.register(done)", "turtle.svg"})
        EXPECT_NE(shim.find(name), string::npos) << name;
}
