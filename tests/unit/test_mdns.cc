#include <catch2/catch_test_macros.hpp>
#include <core/network/discovery/discovery_server.h>
#include <core/network/discovery/mdns_packet.h>
#include <core/network/discovery/service_browser.h>
#include <core/protocol/message.h>

using namespace deckhand::core;

namespace {

ServiceInfo deckInfo() {
    return ServiceInfo{
        .id = "a1",
        .name = "Deck-1",
        .platform = "linux",
        .version = "1.0.0",
        .port = 9000,
        .ips = {"192.168.1.20"},
    };
}

} // namespace

TEST_CASE("mDNS packets survive encoding", "[mdns]") {
    mdns::Packet packet;
    packet.id = 7;
    packet.flags = mdns::kFlagResponse;
    packet.questions.push_back(mdns::Question{.name = ServiceName(), .type = mdns::kPtr});

    mdns::ResourceRecord srv;
    srv.name = "a1." + ServiceName();
    srv.type = mdns::kSrv;
    srv.ttl = 120;
    srv.port = 9000;
    srv.target = "deck.local";
    packet.additionals.push_back(srv);

    mdns::ResourceRecord txt;
    txt.name = srv.name;
    txt.type = mdns::kTxt;
    txt.text = {"id=a1", "name=Deck-1"};
    packet.additionals.push_back(txt);

    mdns::ResourceRecord a;
    a.name = "deck.local";
    a.type = mdns::kA;
    a.address = "10.0.0.5";
    packet.additionals.push_back(a);

    auto decoded = mdns::Decode(mdns::Encode(packet));

    REQUIRE(decoded.id == 7);
    REQUIRE(decoded.IsResponse());
    REQUIRE(decoded.questions.size() == 1);
    REQUIRE(decoded.questions[0].name == ServiceName());
    REQUIRE(decoded.additionals.size() == 3);
    REQUIRE(decoded.additionals[0].port == 9000);
    REQUIRE(decoded.additionals[0].target == "deck.local");
    REQUIRE(decoded.additionals[1].text == std::vector<std::string>{"id=a1", "name=Deck-1"});
    REQUIRE(decoded.additionals[2].address == "10.0.0.5");
}

TEST_CASE("mDNS decoding rejects broken packets", "[mdns]") {
    SECTION("truncated header") {
        std::vector<std::uint8_t> data{0x00, 0x01, 0x84};
        REQUIRE_THROWS_AS(mdns::Decode(data), ProtocolError);
    }

    SECTION("compression pointer to itself") {
        std::vector<std::uint8_t> data{
            0x00, 0x00, 0x00, 0x00, // id, flags
            0x00, 0x01, 0x00, 0x00, // one question
            0x00, 0x00, 0x00, 0x00,
            0xc0, 0x0c,             // name points at offset 12
            0x00, 0x0c, 0x00, 0x01,
        };
        REQUIRE_THROWS_AS(mdns::Decode(data), ProtocolError);
    }

    SECTION("label past the end") {
        std::vector<std::uint8_t> data{
            0x00, 0x00, 0x00, 0x00,
            0x00, 0x01, 0x00, 0x00,
            0x00, 0x00, 0x00, 0x00,
            0x09, 'd', 'e', 'c', 'k',
        };
        REQUIRE_THROWS_AS(mdns::Decode(data), ProtocolError);
    }
}

TEST_CASE("mDNS names compare without case or trailing dot", "[mdns]") {
    REQUIRE(mdns::NameEquals("_deckhand._tcp.local", "_DeckHand._TCP.local."));
    REQUIRE_FALSE(mdns::NameEquals("_deckhand._tcp.local", "_deckhand._udp.local"));
}

TEST_CASE("DiscoveryServer advertises the agent", "[mdns][discovery]") {
    boost::asio::io_context ioc;
    DiscoveryServer server(ioc, deckInfo());

    REQUIRE(server.InstanceName() == "a1." + ServiceName());

    auto txt = DiscoveryServer::TxtRecords(deckInfo());
    REQUIRE(txt == std::vector<std::string>{"id=a1", "name=Deck-1", "platform=linux", "version=1.0.0"});

    auto response = server.BuildResponse(120);
    REQUIRE(response.IsResponse());
    REQUIRE(response.answers.size() == 1);
    REQUIRE(response.answers[0].type == mdns::kPtr);
    REQUIRE(response.answers[0].target == server.InstanceName());
    REQUIRE(response.additionals.size() == 3);
    REQUIRE(response.additionals[0].type == mdns::kSrv);
    REQUIRE(response.additionals[0].port == 9000);
    REQUIRE(response.additionals[2].address == "192.168.1.20");

    auto goodbye = server.BuildResponse(0);
    REQUIRE(goodbye.answers[0].ttl == 0);
}

TEST_CASE("DiscoveryServer answers only questions about itself", "[mdns][discovery]") {
    boost::asio::io_context ioc;
    DiscoveryServer server(ioc, deckInfo());

    mdns::Packet query;
    query.questions.push_back(mdns::Question{.name = ServiceName(), .type = mdns::kPtr});
    REQUIRE(server.Matches(query));

    mdns::Packet instance;
    instance.questions.push_back(mdns::Question{.name = server.InstanceName(), .type = mdns::kSrv});
    REQUIRE(server.Matches(instance));

    mdns::Packet other;
    other.questions.push_back(mdns::Question{.name = "_http._tcp.local", .type = mdns::kPtr});
    REQUIRE_FALSE(server.Matches(other));

    // responses from other responders are never answered
    auto response = server.BuildResponse(120);
    response.questions = query.questions;
    REQUIRE_FALSE(server.Matches(response));
}
