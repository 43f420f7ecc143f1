#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include "hdfs/cluster_config.hpp"
#include "hdfs/hdfs_error.hpp"
#include "hdfs/session.hpp"
#include "test_utils.hpp"

using namespace tbstream::hdfs;

class ClusterConfigTest : public ::testing::Test {
protected:
  std::filesystem::path scratch;

  static void SetUpTestSuite() {
    init_logging();
  }

  void SetUp() override {
    scratch = make_test_dir("tbstream_config");
    ::unsetenv("HADOOP_STREAMING_JAR");
    ::unsetenv("HADOOP_HOME");
  }

  void TearDown() override {
    ::unsetenv("HADOOP_STREAMING_JAR");
    ::unsetenv("HADOOP_HOME");
    ::unsetenv("HADOOP_CMD");
    std::filesystem::remove_all(scratch);
  }

  void touch(const std::filesystem::path& path) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream(path).put('\0');
  }

  static bool system_hadoop_installed() {
    for (const char* dir : {"/usr/lib/hadoop", "/usr/lib/hadoop-mapreduce"}) {
      if (std::filesystem::exists(dir)) {
        return true;
      }
    }
    return false;
  }
};

TEST_F(ClusterConfigTest, DefaultsMatchClusterTools) {
  ::unsetenv("HADOOP_CMD");
  ClusterConfig config;
  EXPECT_EQ(config.hadoop_command, "hadoop");
  EXPECT_EQ(config.java_mem_mb, 100);
  EXPECT_EQ(config.num_procs, 10u);
  EXPECT_TRUE(config.ignore_logs);
  EXPECT_TRUE(config.streaming_jar.empty());
}

TEST_F(ClusterConfigTest, HadoopCmdOverridesTool) {
  ::setenv("HADOOP_CMD", "/opt/hadoop/bin/hadoop", 1);
  EXPECT_EQ(ClusterConfig{}.hadoop_command, "/opt/hadoop/bin/hadoop");
}

TEST_F(ClusterConfigTest, ConfiguredJarWins) {
  ::setenv("HADOOP_STREAMING_JAR", "/env/streaming.jar", 1);
  ClusterConfig config;
  config.streaming_jar = "/configured/hadoop-streaming.jar";
  EXPECT_EQ(find_streaming_jar(config), "/configured/hadoop-streaming.jar");
}

TEST_F(ClusterConfigTest, EnvironmentJarUsedWhenUnconfigured) {
  ::setenv("HADOOP_STREAMING_JAR", "/env/streaming.jar", 1);
  EXPECT_EQ(find_streaming_jar(ClusterConfig{}), "/env/streaming.jar");
}

TEST_F(ClusterConfigTest, DiscoversJarUnderHadoopHome) {
  touch(scratch / "contrib" / "streaming" / "hadoop-0.20.2-streaming.jar");
  touch(scratch / "contrib" / "streaming" / "hadoop-0.20.1-streaming.jar");
  touch(scratch / "contrib" / "streaming" / "streaming-notes.txt");
  ::setenv("HADOOP_HOME", scratch.c_str(), 1);

  EXPECT_EQ(streaming_jar_search_dirs().front(), (scratch / "contrib" / "streaming").string());
  EXPECT_EQ(find_streaming_jar(ClusterConfig{}),
            (scratch / "contrib" / "streaming" / "hadoop-0.20.1-streaming.jar").string());
}

TEST_F(ClusterConfigTest, MissingJarThrows) {
  if (system_hadoop_installed()) {
    GTEST_SKIP() << "A system Hadoop installation may provide a streaming jar";
  }
  ::setenv("HADOOP_HOME", scratch.c_str(), 1);
  EXPECT_THROW(find_streaming_jar(ClusterConfig{}), StreamingJarNotFoundError);
}

TEST_F(ClusterConfigTest, SessionResolvesJarOnce) {
  ::setenv("HADOOP_STREAMING_JAR", "/first.jar", 1);
  ClusterConfig config;
  config.hadoop_command = "hadoop";
  Session session(config);
  EXPECT_EQ(session.streaming_jar(), "/first.jar");
  ::setenv("HADOOP_STREAMING_JAR", "/second.jar", 1);
  EXPECT_EQ(session.streaming_jar(), "/first.jar");
  EXPECT_EQ(session.jar_command("dumptb", "/data/it's"),
            "hadoop jar '/first.jar' dumptb '/data/it'\\''s'");
}

TEST_F(ClusterConfigTest, UnreadableSearchDirectoryIsSkipped) {
  auto locked = scratch / "contrib" / "streaming";
  std::filesystem::create_directories(locked);
  touch(scratch / "hadoop-streaming.jar");
  std::filesystem::permissions(locked, std::filesystem::perms::none);
  ::setenv("HADOOP_HOME", scratch.c_str(), 1);

  std::string jar;
  EXPECT_NO_THROW(jar = find_streaming_jar(ClusterConfig{}));
  std::filesystem::permissions(locked, std::filesystem::perms::owner_all);
  EXPECT_EQ(jar, (scratch / "hadoop-streaming.jar").string());
}
