#include <gtest/gtest.h>
#include <core/config.hpp>
#include <platform/platform.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

static const char* SAMPLE = R"(
cloud:
  provider: command
  launch: "nova boot --image {image_id} --flavor {flavor} {node_name}"
  terminate: "nova delete {instance_id}"
  status: "nova show {instance_id} -f value -c status"
  addresses: "nova show {instance_id} -f value -c addresses"
  running_state: ACTIVE
  command_timeout: 30

login:
  image_user: ubuntu
  user_key_name: deploy
  user_key_public: /keys/id_rsa.pub
  user_key_private: /keys/id_rsa

setup:
  provider: ansible
  playbook: /playbooks/slurm.yml
  extra_args: "-v --forks 20"

clusters:
  slurm:
    image_id: img-base
    flavor: m1.small
    security_group: hpc
    ssh_to: frontend
    startup_timeout: 900
    nodes:
      frontend:
        count: 1
        flavor: m1.large
      compute:
        count: 4
        min: 2
        image_userdata: "#!/bin/sh\necho hi\n"

storage_dir: /var/lib/cumulus
log_level: debug
)";

TEST(Config, ParsesAllSections) {
    auto r = Config::parse(SAMPLE);
    ASSERT_TRUE(r.is_ok()) << r.error;
    const Config& c = r.value;

    EXPECT_EQ(c.cloud().running_state, "ACTIVE");
    EXPECT_EQ(c.cloud().command_timeout, 30);
    EXPECT_EQ(c.cloud().terminate, "nova delete {instance_id}");

    EXPECT_EQ(c.login().image_user, "ubuntu");
    EXPECT_EQ(c.login().user_key_private, "/keys/id_rsa");

    EXPECT_EQ(c.setup().playbook, "/playbooks/slurm.yml");
    EXPECT_EQ(c.setup().extra_args, "-v --forks 20");

    EXPECT_EQ(c.storage_dir(), fs::path("/var/lib/cumulus"));
    EXPECT_EQ(c.log_level(), "debug");
}

TEST(Config, TemplateInheritsClusterDefaults) {
    auto r = Config::parse(SAMPLE);
    ASSERT_TRUE(r.is_ok()) << r.error;

    const ClusterTemplate* t = r.value.find_template("slurm");
    ASSERT_NE(t, nullptr);
    EXPECT_EQ(t->ssh_to, "frontend");
    EXPECT_EQ(t->startup_timeout, 900);
    ASSERT_EQ(t->nodes.size(), 2u);

    const auto& frontend = t->nodes.at("frontend");
    EXPECT_EQ(frontend.count, 1);
    EXPECT_FALSE(frontend.min.has_value());
    EXPECT_EQ(frontend.spec.flavor, "m1.large");      // per-kind override
    EXPECT_EQ(frontend.spec.image_id, "img-base");     // inherited
    EXPECT_EQ(frontend.spec.security_group, "hpc");

    const auto& compute = t->nodes.at("compute");
    EXPECT_EQ(compute.count, 4);
    EXPECT_EQ(compute.min, 2);
    EXPECT_EQ(compute.spec.flavor, "m1.small");
    EXPECT_EQ(compute.spec.image_userdata, "#!/bin/sh\necho hi\n");
}

TEST(Config, MinNodesFallBackToCount) {
    auto r = Config::parse(SAMPLE);
    ASSERT_TRUE(r.is_ok()) << r.error;

    auto mins = template_min_nodes(*r.value.find_template("slurm"));
    EXPECT_EQ(mins.at("frontend"), 1);
    EXPECT_EQ(mins.at("compute"), 2);
}

TEST(Config, UnknownTemplate) {
    auto r = Config::parse(SAMPLE);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.find_template("hadoop"), nullptr);
}

TEST(Config, EmptyDocumentGivesDefaults) {
    auto r = Config::parse("");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.cloud().provider, "command");
    EXPECT_EQ(r.value.cloud().running_state, "running");
    EXPECT_EQ(r.value.setup().provider, "ansible");
    EXPECT_TRUE(r.value.templates().empty());
    EXPECT_EQ(r.value.storage_dir(), platform::cumulus_home() / "storage");
}

TEST(Config, RejectsMinAboveCount) {
    auto r = Config::parse(R"(
clusters:
  bad:
    nodes:
      compute:
        count: 2
        min: 3
)");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("compute"), std::string::npos);
}

TEST(Config, RejectsNonPositiveTimeout) {
    auto r = Config::parse("clusters:\n  bad:\n    startup_timeout: 0\n");
    EXPECT_TRUE(r.is_err());
}

TEST(Config, RejectsMalformedYaml) {
    auto r = Config::parse("cloud: [unclosed");
    EXPECT_TRUE(r.is_err());
}

class ConfigFileTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "cumulus_config_test";
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }
};

TEST_F(ConfigFileTest, LoadFromFile) {
    fs::path path = test_dir / "config.yaml";
    std::ofstream(path) << SAMPLE;

    auto r = Config::load(path);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_NE(r.value.find_template("slurm"), nullptr);
}

TEST_F(ConfigFileTest, MissingFile) {
    auto r = Config::load(test_dir / "nope.yaml");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("not found"), std::string::npos);
}
