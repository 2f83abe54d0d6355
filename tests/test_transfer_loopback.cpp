#include "doctest.h"

#include "engine_test_helpers.h"

#include <utility>

namespace tftpkit::tests {

namespace {

// Shuttle datagrams between two engines until one side has nothing to send.
// Returns the number of datagrams exchanged after the first reply.
int pump(TransferEngine& first, ByteBuffer datagram, TransferEngine& second)
{
    PacketBuffer out{};
    TransferEngine* receiver = &first;
    TransferEngine* other    = &second;

    int exchanged = 0;
    while (!datagram.empty() && exchanged < 1000) {
        auto res = receiver->process(datagram.data(), datagram.size(), out);
        REQUIRE(res.ok());
        datagram = sent(out, res);
        std::swap(receiver, other);
        ++exchanged;
    }
    return exchanged;
}

} // namespace

TEST_CASE("Loopback: peer write lands in the server buffer")
{
    TransferEngine client(2001);
    TransferEngine server(69);
    PacketBuffer out{};

    for (std::size_t size : {std::size_t{0}, std::size_t{100}, std::size_t{1016}, std::size_t{5000}}) {
        CAPTURE(size);
        const ByteBuffer file = pattern_file(size);
        ByteBuffer received;

        auto res = client.initiate_write("upload.bin", file, out);
        REQUIRE(res.ok());

        auto l = server.listen_for_request(out.data(), res.length);
        REQUIRE(l.ok());
        CHECK(l.filename == "upload.bin");

        res = server.reply_as_reader(received, out);
        REQUIRE(res.ok());

        pump(client, sent(out, res), server);

        CHECK_FALSE(client.is_busy());
        CHECK_FALSE(server.is_busy());
        CHECK(received == file);
    }
}

TEST_CASE("Loopback: peer read is served from the server buffer")
{
    TransferEngine client(2002);
    TransferEngine server(69);
    PacketBuffer out{};

    for (std::size_t size : {std::size_t{0}, std::size_t{508}, std::size_t{509}, std::size_t{4096}}) {
        CAPTURE(size);
        const ByteBuffer file = pattern_file(size);
        ByteBuffer received;

        auto res = client.initiate_read("boot.img", received, out);
        REQUIRE(res.ok());

        auto l = server.listen_for_request(out.data(), res.length);
        REQUIRE(l.ok());
        CHECK(server.role() == Role::Writer);

        res = server.reply_as_writer(file, out);
        REQUIRE(res.ok());

        pump(client, sent(out, res), server);

        CHECK_FALSE(client.is_busy());
        CHECK_FALSE(server.is_busy());
        CHECK(received == file);
        CHECK(client.bytes_transferred() == size);
    }
}

TEST_CASE("Loopback: text mode is carried to the server")
{
    TransferEngine client(2003);
    TransferEngine server(69);
    PacketBuffer out{};

    REQUIRE(client.set_mode(Mode::Text) == TransferError::None);

    ByteBuffer received;
    auto res = client.initiate_read("motd", received, out);
    REQUIRE(res.ok());

    REQUIRE(server.listen_for_request(out.data(), res.length).ok());
    CHECK(server.mode() == Mode::Text);

    const ByteBuffer text = to_vec("welcome\r\n");
    res = server.reply_as_writer(text, out);
    REQUIRE(res.ok());
    pump(client, sent(out, res), server);

    CHECK(received == text);
}

TEST_CASE("Loopback: server abort reaches the client as a peer error")
{
    TransferEngine client(2004);
    TransferEngine server(69);
    PacketBuffer out{};

    ByteBuffer received;
    auto res = client.initiate_read("missing", received, out);
    REQUIRE(res.ok());
    REQUIRE(server.listen_for_request(out.data(), res.length).ok());

    res = server.abort(ErrorCode::FileNotFound, "File not found", out);
    REQUIRE(res.ok());
    CHECK_FALSE(server.is_busy());

    res = client.process(out.data(), res.length, out);
    CHECK(res.error == TransferError::ErrorResponse);
    CHECK_FALSE(client.is_busy());
    REQUIRE(client.last_peer_error().has_value());
    CHECK(client.last_peer_error()->code == ErrorCode::FileNotFound);
    CHECK(client.last_peer_error()->message == "File not found");
}

} // namespace tftpkit::tests
