#include <gtest/gtest.h>

#include "runtime/background.hpp"
#include "runtime/types.hpp"

namespace rock::runtime {

/* ----------------------------------------------------------------------------
 * extract_nohup_pid
 * --------------------------------------------------------------------------*/

TEST(extractNohupPid, findsPidBetweenMarkers)
{
    ASSERT_EQ(extract_nohup_pid("...__ROCK_PID_START__12345__ROCK_PID_END__..."), 12345);
}

TEST(extractNohupPid, ignoresSurroundingNoise)
{
    std::string output = "[1] 999\nnohup: ignoring input\n__ROCK_PID_START__77__ROCK_PID_END__\n";

    ASSERT_EQ(extract_nohup_pid(output), 77);
}

TEST(extractNohupPid, firstMatchWins)
{
    std::string output = "__ROCK_PID_START__1__ROCK_PID_END__ __ROCK_PID_START__2__ROCK_PID_END__";

    ASSERT_EQ(extract_nohup_pid(output), 1);
}

TEST(extractNohupPid, absentWithoutMarkers)
{
    ASSERT_FALSE(extract_nohup_pid("12345").has_value());
    ASSERT_FALSE(extract_nohup_pid("").has_value());
    ASSERT_FALSE(extract_nohup_pid("__ROCK_PID_START____ROCK_PID_END__").has_value());
    ASSERT_FALSE(extract_nohup_pid("__ROCK_PID_START__abc__ROCK_PID_END__").has_value());
    ASSERT_FALSE(extract_nohup_pid("__ROCK_PID_START__12345").has_value());
}

TEST(buildNohupCommand, wrapsCommand)
{
    ASSERT_EQ(build_nohup_command("python train.py", "/tmp/tmp_1.out"),
              "nohup python train.py < /dev/null > /tmp/tmp_1.out 2>&1 & "
              "echo __ROCK_PID_START__$!__ROCK_PID_END__;disown");
}

/* ----------------------------------------------------------------------------
 * Wire types
 * --------------------------------------------------------------------------*/

TEST(Observation, fromJsonToleratesMissingFields)
{
    Observation obs = Observation::from_json({{"output", "hi"}});

    ASSERT_EQ(obs.output, "hi");
    ASSERT_FALSE(obs.exit_code.has_value());
    ASSERT_FALSE(obs.succeeded());
}

TEST(Observation, fromJsonReadsAllFields)
{
    Observation obs = Observation::from_json({
        {"output", "done"}, {"exit_code", 0}, {"failure_reason", nullptr}, {"expect_string", "$ "}});

    ASSERT_EQ(obs.output, "done");
    ASSERT_EQ(obs.exit_code, 0);
    ASSERT_EQ(obs.failure_reason, "");
    ASSERT_EQ(obs.expect_string, "$ ");
    ASSERT_TRUE(obs.succeeded());
}

TEST(CommandResponse, fromJson)
{
    CommandResponse resp = CommandResponse::from_json({{"stdout", "out"}, {"stderr", "err"}, {"exit_code", 2}});

    ASSERT_EQ(resp.stdout_text, "out");
    ASSERT_EQ(resp.stderr_text, "err");
    ASSERT_EQ(resp.exit_code, 2);
}

TEST(SandboxStatus, fromJson)
{
    SandboxStatus status = SandboxStatus::from_json({
        {"sandbox_id", "sb-1"}, {"host_name", "node-3"}, {"host_ip", "10.1.2.3"},
        {"is_alive", false}, {"cpus", 4}, {"memory", "16g"}, {"status", {{"image_pull", "running"}}}});

    ASSERT_EQ(status.sandbox_id, "sb-1");
    ASSERT_EQ(status.host_name, "node-3");
    ASSERT_FALSE(status.is_alive);
    ASSERT_EQ(status.cpus, 4.0);
    ASSERT_EQ(status.status["image_pull"], "running");
}

TEST(Command, displayJoinsArgv)
{
    ASSERT_EQ(Command::args({"chmod", "-R", "755", "/data"}).display(), "chmod -R 755 /data");
    ASSERT_EQ(Command::shell("ls -la").display(), "ls -la");
}

TEST(CreateSessionRequest, toJsonOmitsEmptyOptionals)
{
    CreateSessionRequest request;
    request.session = "build";

    nlohmann::json j = request.to_json();
    ASSERT_EQ(j["session"], "build");
    ASSERT_EQ(j["env_enable"], false);
    ASSERT_FALSE(j.contains("env"));
    ASSERT_FALSE(j.contains("remote_user"));
}

TEST(RunMode, parsesAliases)
{
    ASSERT_EQ(run_mode_from_string("nohup"), RunMode::NOHUP);
    ASSERT_EQ(run_mode_from_string("detached"), RunMode::NOHUP);
    ASSERT_EQ(run_mode_from_string("normal"), RunMode::NORMAL);
    ASSERT_STREQ(run_mode_to_string(RunMode::NOHUP), "nohup");
}

} // namespace rock::runtime
