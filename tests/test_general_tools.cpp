//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_general_tools.cpp
// Purpose: GoogleTests for the shared file and workspace tools over an in-memory host
//==========================================================================================================

#include <gtest/gtest.h>
#include "idebridge/tools/GeneralTools.h"
#include "TestHost.h"

using namespace idebridge;

namespace {

class GeneralToolsTest : public ::testing::Test {
protected:
    void SetUp() override {
        files = std::make_shared<test::MemoryFiles>();
        files->files["src/main.cpp"] = "int main() {\n    return 0;\n}";
        files->files["src/util/a.h"] = "#pragma once";
        files->files["README.md"] = "one\ntwo\nthree\nfour";
        workspace = std::make_shared<test::MemoryWorkspace>(files);
        tools::RegisterGeneralTools(registry, test::MakeHost(files, workspace));
        registry.Seal();
    }

    JSONValue call(const std::string& name, JSONValue args) {
        auto ch = std::make_shared<test::CaptureChannel>();
        registry.HandleToolCall(MakeObject({{"name", JSONValue(name)}, {"arguments", std::move(args)}}),
                                Reply(JSONRPCId{int64_t{1}}, ch));
        EXPECT_TRUE(ch->WaitFor(1));
        return ch->Last();
    }

    std::shared_ptr<test::MemoryFiles> files;
    std::shared_ptr<test::MemoryWorkspace> workspace;
    ToolRegistry registry;
};

} // namespace

TEST_F(GeneralToolsTest, RegistersAllSharedTools) {
    auto names = registry.GetRegisteredToolNames();
    std::vector<std::string> expected{"get_current_file", "get_workspace_files", "view", "str_replace", "create", "insert"};
    EXPECT_EQ(names, expected);
    EXPECT_EQ(registry.GetToolDefinitions(ToolCategory::Workspace).size(), 2u);
    EXPECT_EQ(registry.GetToolDefinitions(ToolCategory::File).size(), 4u);
}

TEST_F(GeneralToolsTest, CurrentFileReportsActiveOrNone) {
    EXPECT_EQ(test::ContentText(call("get_current_file", MakeObject({}))), "No file currently active");
    workspace->active = "src/main.cpp";
    EXPECT_EQ(test::ContentText(call("get_current_file", MakeObject({}))), "Current file: src/main.cpp");
}

TEST_F(GeneralToolsTest, WorkspaceFilesFilteredByPattern) {
    const std::string all = test::ContentText(call("get_workspace_files", MakeObject({})));
    EXPECT_EQ(all, "Files in workspace:\nREADME.md\nsrc/main.cpp\nsrc/util/a.h");
    const std::string headers = test::ContentText(call("get_workspace_files", MakeObject({{"pattern", JSONValue("\\.h$")}})));
    EXPECT_EQ(headers, "Files in workspace:\nsrc/util/a.h");
}

TEST_F(GeneralToolsTest, InvalidPatternIsInternalError) {
    JSONValue v = call("get_workspace_files", MakeObject({{"pattern", JSONValue("([")}}));
    EXPECT_EQ(test::ErrorCode(v), JSONRPCErrorCodes::InternalError);
    EXPECT_NE(test::ErrorMessage(v).find("failed to call tool get_workspace_files"), std::string::npos);
}

TEST_F(GeneralToolsTest, ViewNumbersLines) {
    EXPECT_EQ(test::ContentText(call("view", MakeObject({{"path", JSONValue("/README.md")}}))),
              "1: one\n2: two\n3: three\n4: four");
}

TEST_F(GeneralToolsTest, ViewRangeWithOpenEnd) {
    JSONValue range = MakeArray({JSONValue(int64_t{2}), JSONValue(int64_t{-1})});
    EXPECT_EQ(test::ContentText(call("view", MakeObject({{"path", JSONValue("README.md")}, {"view_range", range}}))),
              "2: two\n3: three\n4: four");
    JSONValue middle = MakeArray({JSONValue(int64_t{2}), JSONValue(int64_t{3})});
    EXPECT_EQ(test::ContentText(call("view", MakeObject({{"path", JSONValue("README.md")}, {"view_range", middle}}))),
              "2: two\n3: three");
}

TEST_F(GeneralToolsTest, ViewListsDirectoryChildren) {
    EXPECT_EQ(test::ContentText(call("view", MakeObject({{"path", JSONValue("src")}}))),
              "Directory contents:\nsrc/main.cpp");
    EXPECT_EQ(test::ContentText(call("view", MakeObject({{"path", JSONValue("nowhere/")}}))),
              "Directory is empty or does not exist");
}

TEST_F(GeneralToolsTest, ViewMissingFileIsInternalError) {
    JSONValue v = call("view", MakeObject({{"path", JSONValue("missing.txt")}}));
    EXPECT_EQ(test::ErrorCode(v), JSONRPCErrorCodes::InternalError);
    EXPECT_NE(test::ErrorMessage(v).find("failed to view file/directory"), std::string::npos);
}

TEST_F(GeneralToolsTest, TraversalIsRejected) {
    JSONValue v = call("view", MakeObject({{"path", JSONValue("../etc/passwd")}}));
    EXPECT_EQ(test::ErrorCode(v), JSONRPCErrorCodes::InternalError);
    EXPECT_EQ(test::ErrorMessage(v), "invalid file path");
    EXPECT_EQ(test::ErrorCode(call("view", MakeObject({}))), JSONRPCErrorCodes::InvalidParams);
}

TEST_F(GeneralToolsTest, StrReplaceRequiresExactlyOneMatch) {
    JSONValue ok = call("str_replace", MakeObject({{"path", JSONValue("src/main.cpp")},
                                                   {"old_str", JSONValue("return 0;")},
                                                   {"new_str", JSONValue("return 1;")}}));
    EXPECT_EQ(test::ContentText(ok), "Successfully replaced text at exactly one location.");
    EXPECT_EQ(files->Get("src/main.cpp"), "int main() {\n    return 1;\n}");

    JSONValue none = call("str_replace", MakeObject({{"path", JSONValue("src/main.cpp")},
                                                     {"old_str", JSONValue("absent")},
                                                     {"new_str", JSONValue("x")}}));
    EXPECT_EQ(test::ErrorMessage(none), "No match found for replacement text");

    files->files["dup.txt"] = "x x";
    JSONValue many = call("str_replace", MakeObject({{"path", JSONValue("dup.txt")},
                                                     {"old_str", JSONValue("x")},
                                                     {"new_str", JSONValue("y")}}));
    EXPECT_NE(test::ErrorMessage(many).find("Found 2 matches"), std::string::npos);
    EXPECT_EQ(files->Get("dup.txt"), "x x");
}

TEST_F(GeneralToolsTest, CreateRefusesExistingFile) {
    JSONValue created = call("create", MakeObject({{"path", JSONValue("new/file.txt")}, {"file_text", JSONValue("hello")}}));
    EXPECT_EQ(test::ContentText(created), "Successfully created file: new/file.txt");
    EXPECT_EQ(files->Get("new/file.txt"), "hello");

    JSONValue again = call("create", MakeObject({{"path", JSONValue("new/file.txt")}, {"file_text", JSONValue("x")}}));
    EXPECT_EQ(test::ErrorMessage(again), "File already exists. Use str_replace to modify existing files.");
    EXPECT_EQ(files->Get("new/file.txt"), "hello");
}

TEST_F(GeneralToolsTest, InsertAtBoundaries) {
    call("insert", MakeObject({{"path", JSONValue("README.md")}, {"insert_line", JSONValue(int64_t{0})},
                               {"new_str", JSONValue("zero")}}));
    EXPECT_EQ(files->Get("README.md"), "zero\none\ntwo\nthree\nfour");
    JSONValue end = call("insert", MakeObject({{"path", JSONValue("README.md")}, {"insert_line", JSONValue(int64_t{5})},
                                               {"new_str", JSONValue("five")}}));
    EXPECT_EQ(test::ContentText(end), "Successfully inserted text at line 5 in README.md");
    EXPECT_EQ(files->Get("README.md"), "zero\none\ntwo\nthree\nfour\nfive");

    JSONValue bad = call("insert", MakeObject({{"path", JSONValue("README.md")}, {"insert_line", JSONValue(int64_t{99})},
                                               {"new_str", JSONValue("x")}}));
    EXPECT_EQ(test::ErrorMessage(bad), "Invalid insert_line 99. Must be between 0 and 6");
}

TEST_F(GeneralToolsTest, WriteFailureIsReported) {
    files->readOnly = true;
    JSONValue v = call("create", MakeObject({{"path", JSONValue("ro.txt")}, {"file_text", JSONValue("x")}}));
    EXPECT_EQ(test::ErrorCode(v), JSONRPCErrorCodes::InternalError);
    EXPECT_NE(test::ErrorMessage(v).find("EACCES"), std::string::npos);
}

TEST(GeneralToolsNoHost, MissingProvidersDegrade) {
    ToolRegistry registry;
    tools::RegisterGeneralTools(registry, HostServices{});
    auto ch = std::make_shared<test::CaptureChannel>();
    registry.HandleToolCall(MakeObject({{"name", JSONValue("create")},
                                        {"arguments", MakeObject({{"path", JSONValue("a.txt")},
                                                                  {"file_text", JSONValue("x")}})}}),
                            Reply(JSONRPCId{int64_t{1}}, ch));
    EXPECT_EQ(test::ErrorMessage(ch->Last()), "no file provider configured");
}
