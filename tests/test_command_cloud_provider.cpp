#include <gtest/gtest.h>
#include <providers/command_cloud_provider.hpp>

// These tests run real /bin/sh commands standing in for a cloud CLI.

static CloudConfig echo_cloud() {
    CloudConfig c;
    c.launch = "echo i-{node_name}-{flavor}; echo ignored";
    c.terminate = "true";
    c.status = "echo '  ACTIVE  '";
    c.addresses = "echo 'private=10.0.0.7, 172.16.0.7; public=10.0.0.7'";
    c.running_state = "active";
    c.command_timeout = 10;
    return c;
}

static LaunchParams params_for(const std::string& name) {
    LaunchParams p;
    p.node_name = name;
    p.key_name = "deploy";
    p.public_key = "/keys/id_rsa.pub";
    p.private_key = "/keys/id_rsa";
    p.spec = {"img-1", "ubuntu", "m1.small", "hpc", ""};
    return p;
}

TEST(CommandCloudProvider, LaunchReturnsFirstLine) {
    CommandCloudProvider cloud(echo_cloud());
    auto r = cloud.launch_instance(params_for("compute001"));
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value, "i-compute001-m1.small");
}

TEST(CommandCloudProvider, LaunchPassesUserdataFile) {
    CloudConfig c = echo_cloud();
    c.launch = "head -n 1 {userdata_file}";
    CommandCloudProvider cloud(c);

    auto p = params_for("compute001");
    p.spec.image_userdata = "i-from-userdata\nsecond line\n";
    auto r = cloud.launch_instance(p);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value, "i-from-userdata");
}

TEST(CommandCloudProvider, LaunchFailureCarriesStderr) {
    CloudConfig c = echo_cloud();
    c.launch = "echo 'quota exceeded' >&2; exit 3";
    CommandCloudProvider cloud(c);

    auto r = cloud.launch_instance(params_for("compute001"));
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("exit 3"), std::string::npos);
    EXPECT_NE(r.error.find("quota exceeded"), std::string::npos);
}

TEST(CommandCloudProvider, LaunchWithoutOutputIsError) {
    CloudConfig c = echo_cloud();
    c.launch = "true";
    CommandCloudProvider cloud(c);
    EXPECT_TRUE(cloud.launch_instance(params_for("compute001")).is_err());
}

TEST(CommandCloudProvider, BadTemplateIsError) {
    CloudConfig c = echo_cloud();
    c.launch = "boot {no_such_field}";
    c.status = "show {instance_id";
    CommandCloudProvider cloud(c);

    auto launch = cloud.launch_instance(params_for("compute001"));
    ASSERT_TRUE(launch.is_err());
    EXPECT_NE(launch.error.find("launch"), std::string::npos);
    EXPECT_TRUE(cloud.is_running("i-1").is_err());
}

TEST(CommandCloudProvider, MissingCommandIsError) {
    CloudConfig c = echo_cloud();
    c.addresses.clear();
    CommandCloudProvider cloud(c);
    auto r = cloud.list_addresses("i-1");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("addresses"), std::string::npos);
}

TEST(CommandCloudProvider, StatusComparedCaseInsensitively) {
    CommandCloudProvider cloud(echo_cloud());
    auto r = cloud.is_running("i-1");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_TRUE(r.value);

    CloudConfig c = echo_cloud();
    c.status = "echo BUILD";
    CommandCloudProvider building(c);
    auto b = building.is_running("i-1");
    ASSERT_TRUE(b.is_ok());
    EXPECT_FALSE(b.value);
}

TEST(CommandCloudProvider, StatusReceivesInstanceId) {
    CloudConfig c = echo_cloud();
    c.status = "test {instance_id} = i-42 && echo active";
    CommandCloudProvider cloud(c);

    auto r = cloud.is_running("i-42");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_TRUE(r.value);
    EXPECT_TRUE(cloud.is_running("i-43").is_err());
}

TEST(CommandCloudProvider, AddressesAreDeduplicated) {
    CommandCloudProvider cloud(echo_cloud());
    auto r = cloud.list_addresses("i-1");
    ASSERT_TRUE(r.is_ok()) << r.error;
    ASSERT_EQ(r.value.size(), 2u);
    EXPECT_EQ(r.value[0], "10.0.0.7");
    EXPECT_EQ(r.value[1], "172.16.0.7");
}

TEST(CommandCloudProvider, TerminateNotFoundIsSuccess) {
    CloudConfig c = echo_cloud();
    c.terminate = "echo 'ERROR: Instance {instance_id} Not Found' >&2; exit 1";
    CommandCloudProvider cloud(c);
    EXPECT_TRUE(cloud.terminate_instance("i-1").is_ok());
}

TEST(CommandCloudProvider, TerminateFailure) {
    CloudConfig c = echo_cloud();
    c.terminate = "echo 'permission denied' >&2; exit 1";
    CommandCloudProvider cloud(c);

    auto r = cloud.terminate_instance("i-1");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("permission denied"), std::string::npos);
}

TEST(ExtractIpv4, FindsLiteralsInOrder) {
    auto ips = extract_ipv4_addresses(
        "net0=192.168.1.10\nnet1=10.1.2.3, 192.168.1.10\nversion 1.2.3\n");
    ASSERT_EQ(ips.size(), 2u);
    EXPECT_EQ(ips[0], "192.168.1.10");
    EXPECT_EQ(ips[1], "10.1.2.3");
}

TEST(ExtractIpv4, RejectsOutOfRangeOctets) {
    EXPECT_TRUE(extract_ipv4_addresses("999.1.1.1").empty());
    EXPECT_TRUE(extract_ipv4_addresses("no addresses here").empty());
}
