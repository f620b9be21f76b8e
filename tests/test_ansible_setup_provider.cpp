#include <gtest/gtest.h>
#include <providers/ansible_setup_provider.hpp>
#include "fakes.hpp"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class AnsibleSetupProviderTest : public ::testing::Test {
protected:
    fs::path test_dir;
    std::shared_ptr<MemClusterStore> store = std::make_shared<MemClusterStore>();

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "cumulus_ansible_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    static NodeRecord record(const std::string& name, std::vector<std::string> ips,
                             std::optional<std::string> preferred) {
        NodeRecord r;
        r.name = name;
        r.spec = {"img-1", "ubuntu", "m1.small", "hpc", ""};
        r.instance_id = "i-" + name;
        r.ips = std::move(ips);
        r.preferred_ip = std::move(preferred);
        return r;
    }

    std::unique_ptr<Cluster> make_cluster() {
        ClusterSnapshot snap;
        snap.name = "hpc";
        snap.login = {"ubuntu", "deploy", "/keys/id_rsa.pub", "/keys/id_rsa"};
        snap.groups["frontend"].push_back(
            record("frontend001", {"10.0.0.1", "172.16.0.1"}, std::string("172.16.0.1")));
        snap.groups["compute"].push_back(record("compute001", {"10.0.0.2"}, std::nullopt));
        snap.groups["compute"].push_back(record("compute002", {}, std::nullopt));
        snap.groups["gpu"];

        ClusterProviders p;
        p.cloud = std::make_shared<FakeCloudProvider>();
        p.setup = std::make_shared<FakeSetupProvider>();
        p.transport = std::make_shared<FakeTransport>();
        p.store = store;
        return Cluster::restore(snap, p);
    }
};

TEST_F(AnsibleSetupProviderTest, InventoryHasOneSectionPerKind) {
    auto cluster = make_cluster();
    std::string inv = AnsibleSetupProvider::build_inventory(*cluster);

    EXPECT_EQ(inv,
              "[compute]\n"
              "compute001 ansible_host=10.0.0.2 ansible_user=ubuntu "
              "ansible_ssh_private_key_file=/keys/id_rsa\n"
              "\n"
              "[frontend]\n"
              "frontend001 ansible_host=172.16.0.1 ansible_user=ubuntu "
              "ansible_ssh_private_key_file=/keys/id_rsa\n"
              "\n");
}

TEST_F(AnsibleSetupProviderTest, InventoryPathLivesInStorage) {
    AnsibleSetupProvider setup(SetupConfig{}, test_dir);
    EXPECT_EQ(setup.inventory_path("hpc"), test_dir / "hpc.inventory");
}

TEST_F(AnsibleSetupProviderTest, MissingPlaybookIsError) {
    auto cluster = make_cluster();

    AnsibleSetupProvider unset(SetupConfig{}, test_dir);
    auto r = unset.apply_to(*cluster);
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("playbook"), std::string::npos);

    SetupConfig cfg;
    cfg.playbook = (test_dir / "missing.yml").string();
    AnsibleSetupProvider missing(cfg, test_dir);
    auto m = missing.apply_to(*cluster);
    ASSERT_TRUE(m.is_err());
    EXPECT_NE(m.error.find("missing.yml"), std::string::npos);
    EXPECT_FALSE(fs::exists(missing.inventory_path("hpc")));
}

TEST_F(AnsibleSetupProviderTest, CleanupRemovesInventory) {
    auto cluster = make_cluster();
    AnsibleSetupProvider setup(SetupConfig{}, test_dir);
    std::ofstream(setup.inventory_path("hpc")) << "[compute]\n";

    setup.cleanup(*cluster);
    EXPECT_FALSE(fs::exists(setup.inventory_path("hpc")));

    // Nothing to remove is not an error
    setup.cleanup(*cluster);
}
