#include <gtest/gtest.h>
#include "fakes.hpp"

class NodeTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeCloudProvider> cloud = std::make_shared<FakeCloudProvider>();
    std::shared_ptr<FakeTransport> transport = std::make_shared<FakeTransport>();

    NodePtr make_node(const std::string& name = "compute001") {
        LaunchParams p;
        p.key_name = "deploy";
        p.public_key = "/keys/id_rsa.pub";
        p.private_key = "/keys/id_rsa";
        p.spec = {"img-1", "ubuntu", "m1.small", "hpc", ""};
        return std::make_shared<Node>(name, "compute", p, cloud, transport);
    }

    NodePtr make_restored(std::vector<std::string> ips,
                          std::optional<std::string> preferred) {
        NodeRecord r;
        r.name = "compute001";
        r.kind = "compute";
        r.spec = {"img-1", "ubuntu", "m1.small", "hpc", ""};
        r.instance_id = "i-compute001";
        r.ips = std::move(ips);
        r.preferred_ip = std::move(preferred);
        LoginConfig login{"ubuntu", "deploy", "/keys/id_rsa.pub", "/keys/id_rsa"};
        return Node::from_record(r, login, cloud, transport);
    }
};

TEST_F(NodeTest, LaunchRecordsInstanceId) {
    auto node = make_node();
    EXPECT_FALSE(node->instance_id().has_value());

    ASSERT_TRUE(node->launch().is_ok());
    EXPECT_EQ(node->instance_id(), std::optional<std::string>("i-compute001"));
    ASSERT_EQ(cloud->launched.size(), 1u);
    EXPECT_EQ(cloud->launched[0], "compute001");
}

TEST_F(NodeTest, LaunchFailureLeavesNoId) {
    cloud->fail_launch.insert("compute001");
    auto node = make_node();
    auto r = node->launch();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error, "quota exceeded");
    EXPECT_FALSE(node->instance_id().has_value());
}

TEST_F(NodeTest, TerminateClearsId) {
    auto node = make_node();
    node->launch();
    ASSERT_TRUE(node->terminate().is_ok());
    EXPECT_FALSE(node->instance_id().has_value());
    EXPECT_EQ(cloud->terminate_count("i-compute001"), 1);

    // Nothing left to terminate, the cloud is not asked again
    ASSERT_TRUE(node->terminate().is_ok());
    EXPECT_EQ(cloud->terminate_count("i-compute001"), 1);
}

TEST_F(NodeTest, TerminateErrorKeepsId) {
    cloud->fail_terminate.insert("i-compute001");
    auto node = make_node();
    node->launch();

    EXPECT_TRUE(node->terminate().is_err());
    EXPECT_EQ(node->instance_id(), std::optional<std::string>("i-compute001"));
}

TEST_F(NodeTest, NotAliveWithoutInstance) {
    auto node = make_node();
    EXPECT_FALSE(node->is_alive());
    EXPECT_TRUE(cloud->status_queries.empty());
}

TEST_F(NodeTest, AliveRefreshesAddresses) {
    cloud->addresses["i-compute001"] = {"10.0.0.9", "192.168.0.9"};
    cloud->polls_until_running["i-compute001"] = 1;
    auto node = make_node();
    node->launch();

    EXPECT_FALSE(node->is_alive());
    EXPECT_TRUE(node->ips().empty());

    EXPECT_TRUE(node->is_alive());
    ASSERT_EQ(node->ips().size(), 2u);
    EXPECT_EQ(node->ips()[1], "192.168.0.9");
}

TEST_F(NodeTest, StatusErrorMeansNotYet) {
    cloud->status_error.insert("i-compute001");
    auto node = make_node();
    node->launch();
    EXPECT_FALSE(node->is_alive());
}

TEST_F(NodeTest, ConnectTriesPreferredFirst) {
    transport->reach_all = false;
    transport->reachable = {"10.0.0.3"};
    auto node = make_restored({"10.0.0.1", "10.0.0.2", "10.0.0.3"}, std::string("10.0.0.2"));

    auto conn = node->connect();
    ASSERT_NE(conn, nullptr);
    EXPECT_EQ(conn->address(), "10.0.0.3");

    ASSERT_EQ(transport->attempts.size(), 3u);
    EXPECT_EQ(transport->attempts[0], "10.0.0.2");
    EXPECT_EQ(transport->attempts[1], "10.0.0.1");
    EXPECT_EQ(transport->attempts[2], "10.0.0.3");
    EXPECT_EQ(node->preferred_ip(), std::optional<std::string>("10.0.0.3"));
    EXPECT_EQ(node->connection_ip(), "10.0.0.3");
}

TEST_F(NodeTest, ConnectRemembersWorkingAddress) {
    transport->reach_all = false;
    transport->reachable = {"10.0.0.2"};
    auto node = make_restored({"10.0.0.1", "10.0.0.2", "10.0.0.3"}, std::nullopt);

    auto first = node->connect();
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first->address(), "10.0.0.2");
    EXPECT_EQ(transport->attempts, (std::vector<std::string>{"10.0.0.1", "10.0.0.2"}));

    // The learned address goes first next time
    transport->attempts.clear();
    ASSERT_NE(node->connect(), nullptr);
    EXPECT_EQ(transport->attempts, (std::vector<std::string>{"10.0.0.2"}));

    // Once it stops answering, the rest are tried in their original order
    transport->reachable.clear();
    transport->attempts.clear();
    EXPECT_EQ(node->connect(), nullptr);
    EXPECT_EQ(transport->attempts,
              (std::vector<std::string>{"10.0.0.2", "10.0.0.1", "10.0.0.3"}));
}

TEST_F(NodeTest, ConnectStopsAtFirstSuccess) {
    auto node = make_restored({"10.0.0.1", "10.0.0.2"}, std::nullopt);

    auto conn = node->connect();
    ASSERT_NE(conn, nullptr);
    ASSERT_EQ(transport->attempts.size(), 1u);
    EXPECT_EQ(node->connection_ip(), "10.0.0.1");
    EXPECT_EQ(transport->last_credentials.user, "ubuntu");
    EXPECT_EQ(transport->last_credentials.private_key, "/keys/id_rsa");
}

TEST_F(NodeTest, ConnectUnreachable) {
    transport->reach_all = false;
    auto node = make_restored({"10.0.0.1", "10.0.0.2"}, std::string("10.0.0.1"));

    EXPECT_EQ(node->connect(), nullptr);
    EXPECT_EQ(transport->attempts.size(), 2u);
    // Preference survives a failed round
    EXPECT_EQ(node->connection_ip(), "10.0.0.1");
}

TEST_F(NodeTest, ConnectWithoutAddresses) {
    auto node = make_node();
    EXPECT_EQ(node->connect(), nullptr);
    EXPECT_TRUE(transport->attempts.empty());
}

TEST_F(NodeTest, RecordCarriesState) {
    auto node = make_restored({"10.0.0.1"}, std::string("10.0.0.1"));
    NodeRecord r = node->record();
    EXPECT_EQ(r.name, "compute001");
    EXPECT_EQ(r.kind, "compute");
    EXPECT_EQ(r.instance_id, std::optional<std::string>("i-compute001"));
    EXPECT_EQ(r.preferred_ip, std::optional<std::string>("10.0.0.1"));
    EXPECT_EQ(r.spec.flavor, "m1.small");

    EXPECT_EQ(node->launch_params().node_name, "compute001");
    EXPECT_EQ(node->launch_params().key_name, "deploy");
}

TEST_F(NodeTest, Describe) {
    auto node = make_restored({"10.0.0.1", "10.0.0.2"}, std::string("10.0.0.2"));
    EXPECT_EQ(node->describe(),
              "name=`compute001`, id=`i-compute001`, ips=10.0.0.1, 10.0.0.2, "
              "connection_ip=`10.0.0.2`");
}

TEST_F(NodeTest, PrettyPrint) {
    auto node = make_restored({"10.0.0.1", "10.0.0.2"}, std::string("10.0.0.2"));
    std::string out = node->pprint();
    EXPECT_NE(out.find("compute001"), std::string::npos);
    EXPECT_NE(out.find("10.0.0.1, 10.0.0.2"), std::string::npos);
    EXPECT_NE(out.find("i-compute001"), std::string::npos);
    EXPECT_NE(out.find("m1.small"), std::string::npos);
}
