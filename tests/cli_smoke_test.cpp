// Command line smoke test: run the built errorsmith and errorsmith_sites binaries on the fixture files.
#include <gtest/gtest.h>
#include <array>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>
#include <sys/wait.h>

namespace {

struct Run {
    int status{-1};
    std::string out;
    std::string err;
};

std::string read_all(const std::filesystem::path& p){
    std::ifstream ifs(p, std::ios::binary); if(!ifs) return {};
    std::string s; ifs.seekg(0,std::ios::end); s.resize((size_t)ifs.tellg()); ifs.seekg(0); ifs.read(&s[0], s.size()); return s;
}

std::size_t count(const std::string& s, const std::string& needle){
    std::size_t n = 0;
    for(auto at = s.find(needle); at != std::string::npos; at = s.find(needle, at + 1)) ++n;
    return n;
}

#if defined(ERRORSMITH_TOOL) && defined(ERRORSMITH_SITES_TOOL) && defined(ERRORSMITH_FIXTURE_DIR) && defined(ERRORSMITH_SCRATCH_DIR)
#define ERRORSMITH_HAVE_TOOLS 1

std::filesystem::path scratch(){
    auto dir = std::filesystem::path(ERRORSMITH_SCRATCH_DIR) / "cli_smoke";
    std::filesystem::create_directories(dir);
    return dir;
}

std::string fixture(const char* name){
    return (std::filesystem::path(ERRORSMITH_FIXTURE_DIR) / name).string();
}

// stdout comes back through the pipe, stderr through a scratch file.
Run run(const std::string& exe, const std::string& args){
    const auto err_path = scratch() / "stderr.txt";
    std::string cmd = exe + " " + args + " 2>" + err_path.string();
    Run r;
    FILE* p = popen(cmd.c_str(), "r");
    if(!p) return r;
    std::array<char, 512> buf{};
    while(fgets(buf.data(), (int)buf.size(), p)){ r.out += buf.data(); }
    const int st = pclose(p);
    r.status = WIFEXITED(st) ? WEXITSTATUS(st) : -1;
    r.err = read_all(err_path);
    return r;
}

Run errorsmith(const std::string& args){ return run(ERRORSMITH_TOOL, args); }
Run sites(const std::string& args){ return run(ERRORSMITH_SITES_TOOL, args); }

#endif

} // namespace

#ifndef ERRORSMITH_HAVE_TOOLS
TEST(CliSmoke, Skipped){
    GTEST_SKIP() << "tool paths not defined, skipping";
}
#else

TEST(CliSmoke, NoInputIsUsageError){
    auto r = errorsmith("");
    EXPECT_EQ(r.status, 2);
    EXPECT_NE(r.err.find("Usage of 'errorsmith':"), std::string::npos) << r.err;
    EXPECT_TRUE(r.out.empty());
}

TEST(CliSmoke, BadPercentIsUsageError){
    auto hi = errorsmith("-error-percent 150 " + fixture("guard.go"));
    EXPECT_EQ(hi.status, 2) << hi.err;
    EXPECT_NE(hi.err.find("no valid modulus"), std::string::npos) << hi.err;
    auto zero = errorsmith("-error-percent 0 " + fixture("guard.go"));
    EXPECT_EQ(zero.status, 2) << zero.err;
    EXPECT_TRUE(zero.out.empty());
}

TEST(CliSmoke, ParseFailureWritesNothing){
    const auto out = scratch() / "broken_out.go";
    std::filesystem::remove(out);
    auto r = errorsmith("-o " + out.string() + " " + fixture("broken.go"));
    EXPECT_EQ(r.status, 1);
    EXPECT_FALSE(std::filesystem::exists(out));
    // file:line:col once, then the parser's own message
    EXPECT_EQ(count(r.err, "broken.go:"), 1u) << r.err;
    EXPECT_NE(r.err.find("broken.go:5:1: expected ')'"), std::string::npos) << r.err;
}

TEST(CliSmoke, MissingInputFails){
    auto r = errorsmith(fixture("no_such_file.go"));
    EXPECT_EQ(r.status, 1);
    EXPECT_NE(r.err.find("no_such_file.go"), std::string::npos) << r.err;
}

TEST(CliSmoke, UncreatableOutputFails){
    const auto out = scratch() / "no_such_dir" / "x.go";
    auto r = errorsmith("-o " + out.string() + " " + fixture("guard.go"));
    EXPECT_EQ(r.status, 1) << r.err;
    EXPECT_FALSE(std::filesystem::exists(out));
}

TEST(CliSmoke, RewritesToOutputFile){
    const auto out = scratch() / "guard_out.go";
    std::filesystem::remove(out);
    auto r = errorsmith("-o " + out.string() + " " + fixture("guard.go"));
    ASSERT_EQ(r.status, 0) << r.err;
    auto text = read_all(out);
    EXPECT_NE(text.find("if _errorsmith_rand_.Int()%20 == 0 {"), std::string::npos) << text;
    EXPECT_NE(text.find("guard.go:7\\n\")"), std::string::npos) << text;
    EXPECT_NE(text.find("import _errorsmith_fmt_ \"fmt\""), std::string::npos) << text;
}

TEST(CliSmoke, PercentAndTraceFlags){
    auto r = errorsmith("-error-percent 100 -trace=false " + fixture("guard.go"));
    ASSERT_EQ(r.status, 0) << r.err;
    EXPECT_NE(r.out.find("Int()%1 == 0"), std::string::npos) << r.out;
    EXPECT_EQ(r.out.find("_errorsmith_fmt_.Printf(\"injected"), std::string::npos) << r.out;
    EXPECT_NE(r.out.find("_errorsmith_fmt_.Errorf(\"injected error at"), std::string::npos) << r.out;
}

TEST(CliSmoke, SitesListsGuards){
    auto r = sites(fixture("guard.go"));
    ASSERT_EQ(r.status, 0) << r.err;
    EXPECT_NE(r.out.find("guard.go:7:2: if err != nil\n"), std::string::npos) << r.out;
    EXPECT_NE(r.out.find("1 site(s)\n"), std::string::npos) << r.out;

    auto chain = sites(fixture("chain.go"));
    ASSERT_EQ(chain.status, 0) << chain.err;
    EXPECT_NE(chain.out.find("chain.go:6:9: if err != nil\n"), std::string::npos) << chain.out;
    EXPECT_NE(chain.out.find("chain.go:8:9: if err == nil\n"), std::string::npos) << chain.out;
    EXPECT_NE(chain.out.find("2 site(s)\n"), std::string::npos) << chain.out;
}

TEST(CliSmoke, SitesTreeAndErrors){
    auto r = sites("-tree " + fixture("guard.go"));
    ASSERT_EQ(r.status, 0) << r.err;
    EXPECT_NE(r.out.find("(if (!= err nil) {"), std::string::npos) << r.out;

    auto broken = sites(fixture("broken.go"));
    EXPECT_EQ(broken.status, 1);
    EXPECT_NE(broken.err.find("broken.go:5:1: parse error: expected ')'"), std::string::npos) << broken.err;
    EXPECT_TRUE(broken.out.empty());

    EXPECT_EQ(sites("").status, 2);
}

#endif
