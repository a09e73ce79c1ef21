#include <catch2/catch_test_macros.hpp>
#include <sstream>
#include "certscan/inventory/reporter.hpp"
#include "test_helpers.hpp"

using namespace certscan;
using namespace certscan::inventory;
using namespace testhelpers;

TEST_CASE("Describe生成各类对象的描述", "[reporter]") {
    auto rootKey = GenerateRSAKey();
    auto leafKey = GenerateRSAKey();

    storage::ArtifactList artifacts = {
        {"root.pem", Classify(SelfSignedCertificatePEM(rootKey.get(), "Root", 1)).value()},
        {"leaf.key", Classify(PrivateKeyPEM(leafKey.get())).value()},
        {"leaf.pub", Classify(RSAPublicKeyPEM(leafKey.get())).value()}
    };
    auto registry = BuildRegistry(artifacts);

    SECTION("证书") {
        REQUIRE(Describe(artifacts[0].second, registry) ==
                "Certificate for CN=Root\n"
                "    with key key<CN=Root>\n"
                "    serial number 1\n"
                "    issued by CN=Root\n"
                "    signed by key<CN=Root>");
    }

    SECTION("私钥和公钥") {
        REQUIRE(Describe(artifacts[1].second, registry) == "Private key for key<leaf.key>");
        REQUIRE(Describe(artifacts[2].second, registry) == "Public key for key<leaf.key>");
    }

    SECTION("证书请求") {
        auto request = Classify(CertificateRequestPEM(leafKey.get(), "Leaf")).value();
        REQUIRE(Describe(request, registry) ==
                "Certificate request for CN=Leaf\n"
                "    with key key<leaf.key>\n"
                "    signed by key<leaf.key>");
    }

    SECTION("没有吊销条目的CRL") {
        auto crl = Classify(RevocationListPEM(rootKey.get(), "Root", {})).value();
        REQUIRE(Describe(crl, registry) ==
                "Revocation list revoking nothing\n"
                "    issued by CN=Root\n"
                "    signed by key<CN=Root>");
    }

    SECTION("有吊销条目的CRL") {
        auto crl = Classify(RevocationListPEM(rootKey.get(), "Root", {7, 42})).value();
        REQUIRE(Describe(crl, registry) ==
                "Revocation list revoking serial numbers [7, 42]\n"
                "    issued by CN=Root\n"
                "    signed by key<CN=Root>");
    }

    SECTION("未知签名者") {
        auto strangerKey = GenerateRSAKey();
        auto crl = Classify(RevocationListPEM(strangerKey.get(), "Stranger", {3})).value();
        REQUIRE(Describe(crl, registry) ==
                "Revocation list revoking serial numbers [3]\n"
                "    issued by CN=Stranger\n"
                "    signed by ???");
    }

    SECTION("空对象返回Unknown") {
        Artifact empty = std::shared_ptr<utils::Certificate>();
        REQUIRE(Describe(empty, registry) == "Unknown");
    }
}

TEST_CASE("BuildReport按描述排序，描述相同时按路径排序", "[reporter]") {
    auto key = GenerateRSAKey();

    storage::ArtifactList artifacts = {
        {"z/cert.pem", Classify(SelfSignedCertificatePEM(key.get(), "Root")).value()},
        {"b.key", Classify(PrivateKeyPEM(key.get())).value()},
        {"a.key", Classify(PrivateKeyPEM(key.get())).value()},
        {"crl.pem", Classify(RevocationListPEM(key.get(), "Root", {})).value()}
    };

    auto entries = BuildReport(artifacts);
    REQUIRE(entries.size() == 4);
    REQUIRE(entries[0].path == "z/cert.pem");
    REQUIRE(entries[1].path == "a.key");
    REQUIRE(entries[1].description == "Private key for key<CN=Root>");
    REQUIRE(entries[2].path == "b.key");
    REQUIRE(entries[2].description == "Private key for key<CN=Root>");
    REQUIRE(entries[3].path == "crl.pem");
}

TEST_CASE("BuildReport跳过处理失败的对象", "[reporter]") {
    auto key = GenerateRSAKey();

    storage::ArtifactList artifacts = {
        {"root.pem", Classify(SelfSignedCertificatePEM(key.get(), "Root")).value()},
        // 没有底层X509对象的证书，提取和描述都会失败
        {"broken.pem", std::make_shared<utils::Certificate>()}
    };

    auto entries = BuildReport(artifacts);
    REQUIRE(entries.size() == 1);
    REQUIRE(entries[0].path == "root.pem");
}

TEST_CASE("PrintReport的输出格式", "[reporter]") {
    std::vector<ReportEntry> entries = {
        {"Private key for key<CN=Leaf>", "/ca/leaf.key"},
        {"Public key for key<CN=Leaf>", "/ca/leaf.pub"}
    };

    std::stringstream out;
    PrintReport(entries, out);
    REQUIRE(out.str() ==
            "/ca/leaf.key:\n"
            "  Private key for key<CN=Leaf>\n"
            "\n"
            "/ca/leaf.pub:\n"
            "  Public key for key<CN=Leaf>\n"
            "\n");
}

TEST_CASE("RunInventory端到端扫描", "[reporter][e2e]") {
    TempDir dir;
    auto rootKey = GenerateRSAKey();
    auto leafKey = GenerateRSAKey();

    auto rootPath = dir.WriteFile("root.pem", SelfSignedCertificatePEM(rootKey.get(), "Root", 1));
    auto requestPath = dir.WriteFile("leaf.csr", CertificateRequestPEM(leafKey.get(), "Leaf"));
    auto keyPath = dir.WriteFile("private/leaf.key", PrivateKeyPEM(leafKey.get()));
    dir.WriteFile("serial", "not a pem file\n");

    std::stringstream out;
    RunInventory({dir.Path().string()}, ScanConfig(), out);

    REQUIRE(out.str() ==
            rootPath.string() + ":\n"
            "  Certificate for CN=Root\n"
            "    with key key<CN=Root>\n"
            "    serial number 1\n"
            "    issued by CN=Root\n"
            "    signed by key<CN=Root>\n"
            "\n" +
            requestPath.string() + ":\n"
            "  Certificate request for CN=Leaf\n"
            "    with key key<CN=Leaf>\n"
            "    signed by key<CN=Leaf>\n"
            "\n" +
            keyPath.string() + ":\n"
            "  Private key for key<CN=Leaf>\n"
            "\n");
}

TEST_CASE("RunInventory先输出警告再输出报告", "[reporter][e2e]") {
    TempDir dir;
    auto key = GenerateRSAKey();
    auto keyPath = dir.WriteFile("a.key", PrivateKeyPEM(key.get()));
    auto junkPath = dir.WriteFile("junk.txt", "garbage\n");

    std::stringstream out;
    RunInventory({keyPath.string(), junkPath.string()}, ScanConfig(), out);

    REQUIRE(out.str() ==
            "WARNING: file " + junkPath.string() + " could not be interpreted\n" +
            keyPath.string() + ":\n"
            "  Private key for key<" + keyPath.string() + ">\n"
            "\n");
}

TEST_CASE("RunInventory遇到I/O错误时不输出报告", "[reporter][e2e]") {
    TempDir dir;
    auto key = GenerateRSAKey();
    auto keyPath = dir.WriteFile("a.key", PrivateKeyPEM(key.get()));

    std::stringstream out;
    REQUIRE_THROWS_AS(RunInventory({keyPath.string(), (dir.Path() / "missing").string()}, ScanConfig(), out),
                      IOError);
    REQUIRE(out.str().empty());
}
