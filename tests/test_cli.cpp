#include <gtest/gtest.h>

#include "io/process.hpp"

#include "testing.hpp"

#ifndef FWBUNDLE_BIN
#error "FWBUNDLE_BIN must point at the fwbundle executable"
#endif

namespace fwbundle {

namespace {

std::string Quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out.push_back(c);
    }
    return out + "'";
}

struct CliRun {
    int exit_code = -1;
    std::string output;
};

// Runs fwbundle with stderr folded into stdout. An empty idf_path runs it
// with IDF_PATH unset.
CliRun RunCli(const std::vector<std::string>& args, const std::string& idf_path, const std::string& cwd) {
    std::string cmd = idf_path.empty() ? "unset IDF_PATH; " : "IDF_PATH=" + Quote(idf_path) + " ";
    cmd += Quote(FWBUNDLE_BIN);
    for (const auto& a : args) cmd += " " + Quote(a);
    cmd += " 2>&1";

    ProcessRequest req;
    req.argv = {"sh", "-c", cmd};
    req.working_dir = cwd;
    req.capture_stdout = true;

    ProcessOutcome out;
    auto r = RunProcess(req, out);
    if (!r.is_ok()) throw std::runtime_error(r.msg);
    return {out.exit_code, out.stdout_text};
}

class CliTest : public ::testing::Test {
  protected:
    void SetUp() override {
        root_ = tmp_.Sub("sensor_node");
        std::filesystem::create_directories(root_ + "/.git");
        testutil::WriteBuildDir(tmp_.Sub("fixture"));

        // Minimal idf.py: "-B <dir> [-D ...] build" copies a finished build into <dir>.
        tool_ = tmp_.Sub("bin/fake-idf.py");
        testutil::WriteFile(tool_,
                            "#!/bin/sh\n"
                            "echo \"$@\" > " + Quote(tmp_.Sub("tool-args.txt")) + "\n"
                            "[ \"$1\" = \"-B\" ] || exit 2\n"
                            "mkdir -p \"$2\"\n"
                            "cp -R " + Quote(tmp_.Sub("fixture")) + "/. \"$2\"/\n",
                            0755);
    }

    bool ToolRan() const { return std::filesystem::exists(tmp_.Sub("tool-args.txt")); }

    testutil::TemporaryDirectory tmp_;
    std::string root_;
    std::string tool_;
};

bool Contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

TEST_F(CliTest, DevBuildProducesBundle) {
    auto run = RunCli({"build", "-t", "dev", "-n", "nightly", "--build-tool", tool_}, "/opt/esp-idf", root_);
    ASSERT_EQ(run.exit_code, 0) << run.output;

    const std::string bundle = root_ + "/release/sensor_node_nightly.zip";
    EXPECT_TRUE(Contains(run.output, bundle)) << run.output;
    ASSERT_TRUE(std::filesystem::exists(bundle));
    EXPECT_TRUE(ToolRan());
    EXPECT_TRUE(Contains(testutil::ReadFile(tmp_.Sub("tool-args.txt")), "-B " + root_ + "/build"));

    const auto listing = testutil::ReadBundle(bundle);
    EXPECT_FALSE(listing.Has("digest.bin"));
    EXPECT_TRUE(listing.Has("sensor_node.bin"));
}

TEST_F(CliTest, ReleaseWithMissingKeyFailsBeforeBuild) {
    auto run = RunCli({"build", "-k", root_ + "/keys/absent.pem", "-n", "v1", "--build-tool", tool_},
                      "/opt/esp-idf", root_);
    EXPECT_EQ(run.exit_code, 1);
    EXPECT_TRUE(Contains(run.output, "ERROR [validate_inputs] ConfigurationError")) << run.output;
    EXPECT_TRUE(Contains(run.output, "absent.pem"));
    EXPECT_FALSE(ToolRan());
    EXPECT_FALSE(std::filesystem::exists(root_ + "/build"));
}

TEST_F(CliTest, ReleaseBuildWithKeyAddsDigest) {
    testutil::WriteEcKey(root_ + "/keys/secure_boot_signing_key.pem");
    auto run = RunCli({"build", "-n", "v1.4.0", "--build-tool", tool_}, "/opt/esp-idf", root_);
    ASSERT_EQ(run.exit_code, 0) << run.output;

    const auto listing = testutil::ReadBundle(root_ + "/release/sensor_node_v1.4.0.zip");
    EXPECT_TRUE(listing.Has("digest.bin"));
    EXPECT_TRUE(Contains(listing.Data("flash.sh"), "WARNING: secure boot is enabled"));
    EXPECT_TRUE(Contains(testutil::ReadFile(tmp_.Sub("tool-args.txt")),
                         "SDKCONFIG_DEFAULTS=sdkconfig.defaults;sdkconfig.release"));
}

TEST_F(CliTest, MissingIdfPathIsBuildToolError) {
    auto run = RunCli({"build", "-t", "dev", "-n", "v1", "--build-tool", tool_}, "", root_);
    EXPECT_EQ(run.exit_code, 1);
    EXPECT_TRUE(Contains(run.output, "BuildToolError")) << run.output;
    EXPECT_TRUE(Contains(run.output, "IDF_PATH"));
    EXPECT_FALSE(ToolRan());
}

TEST_F(CliTest, FailingBuildToolIsReported) {
    testutil::WriteFile(tool_, "#!/bin/sh\nexit 3\n", 0755);
    auto run = RunCli({"build", "-t", "dev", "-n", "v1", "--build-tool", tool_}, "/opt/esp-idf", root_);
    EXPECT_EQ(run.exit_code, 1);
    EXPECT_TRUE(Contains(run.output, "ERROR [invoke_build_tool] BuildToolError")) << run.output;
    EXPECT_TRUE(testutil::ListDir(root_ + "/release").empty());
}

TEST_F(CliTest, PackageExistingBuildAndInspect) {
    testutil::WriteBuildDir(root_ + "/build");
    auto run = RunCli({"package", "-t", "dev"}, "", root_);
    ASSERT_EQ(run.exit_code, 0) << run.output;

    const std::string bundle = root_ + "/release/sensor_node_v1.4.0.zip";
    ASSERT_TRUE(std::filesystem::exists(bundle));

    auto inspect = RunCli({"inspect", bundle}, "", root_);
    ASSERT_EQ(inspect.exit_code, 0) << inspect.output;
    EXPECT_TRUE(Contains(inspect.output, "flasher_args.json"));
    EXPECT_TRUE(Contains(inspect.output, "0755"));
    EXPECT_TRUE(Contains(inspect.output, "ota_data_initial.bin"));
}

TEST_F(CliTest, UsageErrorsExitWithTwo) {
    EXPECT_EQ(RunCli({}, "", root_).exit_code, 2);
    EXPECT_EQ(RunCli({"deploy"}, "", root_).exit_code, 2);
    EXPECT_EQ(RunCli({"build", "-t", "debug"}, "", root_).exit_code, 2);
    EXPECT_EQ(RunCli({"build", "stray"}, "", root_).exit_code, 2);
    EXPECT_EQ(RunCli({"package", "--build-tool", "x"}, "", root_).exit_code, 2);
    EXPECT_EQ(RunCli({"inspect"}, "", root_).exit_code, 2);
}

TEST_F(CliTest, InspectMissingBundleFails) {
    auto run = RunCli({"inspect", tmp_.Sub("nope.zip")}, "", root_);
    EXPECT_EQ(run.exit_code, 1);
    EXPECT_TRUE(Contains(run.output, "ERROR"));
}

} // namespace fwbundle
