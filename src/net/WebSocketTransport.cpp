// SPDX-License-Identifier: Apache-2.0
#include "WebSocketTransport.hpp"

#include <core/Log.hpp>
#include <net/WebSocketFrame.hpp>

#include <boost/asio/buffers_iterator.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/asio/streambuf.hpp>
#include <boost/asio/write.hpp>

#include <openssl/ssl.h>

#include <array>
#include <deque>
#include <format>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace gatelink
{

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace
{
    constexpr auto wsLog = log::Channel { "ws" };
} // namespace

class WebSocketTransport::Connection: public std::enable_shared_from_this<Connection>
{
  public:
    Connection(asio::io_context& io, asio::ssl::context& tls): _io(io), _tls(tls), _resolver(io) {}

    void open(std::string_view url, TransportHandler handler);
    auto send(ws::Opcode opcode, std::span<const std::uint8_t> payload) -> VoidResult;
    void close();
    void terminate();

    [[nodiscard]] auto isOpen() const noexcept -> bool { return _state == State::Open; }

  private:
    using TlsStream = asio::ssl::stream<tcp::socket>;

    enum class State : std::uint8_t
    {
        Idle,
        Connecting,
        Open,
        Closing,
        Closed,
    };

    asio::io_context& _io;
    asio::ssl::context& _tls;
    tcp::resolver _resolver;
    std::variant<std::monostate, tcp::socket, TlsStream> _stream;
    State _state = State::Idle;
    TransportHandler _handler;

    ws::Url _url;
    std::string _clientKey;
    std::string _upgradeRequest;
    asio::streambuf _upgradeResponse;

    std::array<std::uint8_t, 8192> _readChunk {};
    std::vector<std::uint8_t> _inbox;
    std::vector<std::uint8_t> _message;
    bool _inMessage = false;
    bool _messageIsText = false;

    std::deque<std::vector<std::uint8_t>> _outbox;
    bool _writing = false;
    bool _closeAfterFlush = false;

    template <typename Function>
    void withStream(Function&& function)
    {
        std::visit(
            [&](auto& stream) {
                if constexpr (!std::is_same_v<std::decay_t<decltype(stream)>, std::monostate>)
                    function(stream);
            },
            _stream);
    }

    auto socket() -> tcp::socket&
    {
        if (auto* tls = std::get_if<TlsStream>(&_stream))
            return tls->next_layer();
        return std::get<tcp::socket>(_stream);
    }

    void connectTo(const tcp::resolver::results_type& endpoints);
    void startTls();
    void sendUpgrade();
    void readUpgrade();
    void completeUpgrade(std::size_t headerSize);
    void readSome();
    void processInbox();
    void handleFrame(ws::Frame frame);
    void deliverMessage();
    void queueFrame(std::vector<std::uint8_t> frame);
    void writeNext();
    void postFailure(Error error);
    void fail(Error error);
    void remoteClosed();
    void shutdownSocket();
};

// {{{ Connection

void WebSocketTransport::Connection::open(std::string_view url, TransportHandler handler)
{
    _handler = std::move(handler);
    _state = State::Connecting;

    auto parsed = ws::parseUrl(url);
    if (!parsed)
    {
        postFailure(Error { ErrorCode::TransportError, parsed.error().message });
        return;
    }
    _url = std::move(*parsed);

    auto key = ws::randomHandshakeKey();
    if (!key)
    {
        postFailure(key.error());
        return;
    }
    _clientKey = std::move(*key);

    if (_url.secure)
        _stream.emplace<TlsStream>(_io, _tls);
    else
        _stream.emplace<tcp::socket>(_io);

    wsLog.debug("Resolving {}:{}", _url.host, _url.port);
    _resolver.async_resolve(
        _url.host,
        _url.port,
        [self = shared_from_this()](const boost::system::error_code& ec, tcp::resolver::results_type results) {
            if (self->_state != State::Connecting)
                return;
            if (ec)
            {
                self->fail(Error { ErrorCode::TransportError,
                                   std::format("Cannot resolve {}: {}", self->_url.host, ec.message()) });
                return;
            }
            self->connectTo(results);
        });
}

void WebSocketTransport::Connection::connectTo(const tcp::resolver::results_type& endpoints)
{
    asio::async_connect(
        socket(), endpoints, [self = shared_from_this()](const boost::system::error_code& ec, const tcp::endpoint&) {
            if (self->_state != State::Connecting)
                return;
            if (ec)
            {
                self->fail(Error { ErrorCode::TransportError,
                                   std::format("Cannot connect to {}:{}: {}",
                                               self->_url.host,
                                               self->_url.port,
                                               ec.message()) });
                return;
            }
            if (self->_url.secure)
                self->startTls();
            else
                self->sendUpgrade();
        });
}

void WebSocketTransport::Connection::startTls()
{
    auto& stream = std::get<TlsStream>(_stream);
    if (!SSL_set_tlsext_host_name(stream.native_handle(), _url.host.c_str()))
    {
        fail(Error { ErrorCode::TransportError, "Cannot set TLS server name" });
        return;
    }
    stream.set_verify_mode(asio::ssl::verify_peer);
    stream.set_verify_callback(asio::ssl::host_name_verification(_url.host));

    stream.async_handshake(asio::ssl::stream_base::client,
                           [self = shared_from_this()](const boost::system::error_code& ec) {
                               if (self->_state != State::Connecting)
                                   return;
                               if (ec)
                               {
                                   self->fail(Error { ErrorCode::TransportError,
                                                      std::format("TLS handshake failed: {}", ec.message()) });
                                   return;
                               }
                               self->sendUpgrade();
                           });
}

void WebSocketTransport::Connection::sendUpgrade()
{
    _upgradeRequest = ws::buildUpgradeRequest(_url, _clientKey);
    withStream([&](auto& stream) {
        asio::async_write(stream,
                          asio::buffer(_upgradeRequest),
                          [self = shared_from_this()](const boost::system::error_code& ec, std::size_t) {
                              if (self->_state != State::Connecting)
                                  return;
                              if (ec)
                              {
                                  self->fail(Error { ErrorCode::TransportError,
                                                     std::format("Cannot send upgrade request: {}", ec.message()) });
                                  return;
                              }
                              self->readUpgrade();
                          });
    });
}

void WebSocketTransport::Connection::readUpgrade()
{
    withStream([&](auto& stream) {
        asio::async_read_until(stream,
                               _upgradeResponse,
                               "\r\n\r\n",
                               [self = shared_from_this()](const boost::system::error_code& ec, std::size_t size) {
                                   if (self->_state != State::Connecting)
                                       return;
                                   if (ec)
                                   {
                                       self->fail(Error {
                                           ErrorCode::TransportError,
                                           std::format("Cannot read upgrade response: {}", ec.message()) });
                                       return;
                                   }
                                   self->completeUpgrade(size);
                               });
    });
}

void WebSocketTransport::Connection::completeUpgrade(std::size_t headerSize)
{
    auto const data = _upgradeResponse.data();
    auto const begin = asio::buffers_begin(data);
    auto const headers = std::string(begin, begin + static_cast<std::ptrdiff_t>(headerSize));
    _upgradeResponse.consume(headerSize);

    if (auto valid = ws::validateUpgradeResponse(headers, _clientKey); !valid)
    {
        fail(valid.error());
        return;
    }

    // Frames the server sent right behind the upgrade response.
    auto const rest = _upgradeResponse.data();
    _inbox.assign(asio::buffers_begin(rest), asio::buffers_end(rest));
    _upgradeResponse.consume(_upgradeResponse.size());

    _state = State::Open;
    wsLog.debug("Connected to {}:{}{}", _url.host, _url.port, _url.target);

    auto onOpen = _handler.onOpen;
    if (onOpen)
        onOpen();

    if (_state != State::Open)
        return;
    processInbox();
    if (_state == State::Open)
        readSome();
}

void WebSocketTransport::Connection::readSome()
{
    withStream([&](auto& stream) {
        stream.async_read_some(
            asio::buffer(_readChunk),
            [self = shared_from_this()](const boost::system::error_code& ec, std::size_t size) {
                if (self->_state != State::Open)
                    return;
                if (ec == asio::error::eof || ec == asio::ssl::error::stream_truncated)
                {
                    self->remoteClosed();
                    return;
                }
                if (ec)
                {
                    self->fail(Error { ErrorCode::TransportError, std::format("Read failed: {}", ec.message()) });
                    return;
                }
                self->_inbox.insert(self->_inbox.end(), self->_readChunk.begin(), self->_readChunk.begin() + size);
                self->processInbox();
                if (self->_state == State::Open)
                    self->readSome();
            });
    });
}

void WebSocketTransport::Connection::processInbox()
{
    while (_state == State::Open)
    {
        auto decoded = ws::decodeFrame(_inbox);
        if (!decoded)
        {
            fail(decoded.error());
            return;
        }
        if (!*decoded)
            return;

        auto& [frame, consumed] = **decoded;
        _inbox.erase(_inbox.begin(), _inbox.begin() + static_cast<std::ptrdiff_t>(consumed));
        handleFrame(std::move(frame));
    }
}

void WebSocketTransport::Connection::handleFrame(ws::Frame frame)
{
    switch (frame.opcode)
    {
        case ws::Opcode::Text:
        case ws::Opcode::Binary:
            if (_inMessage)
            {
                fail(Error { ErrorCode::TransportError, "New WebSocket message inside a fragmented message" });
                return;
            }
            _message = std::move(frame.payload);
            _messageIsText = frame.opcode == ws::Opcode::Text;
            _inMessage = !frame.fin;
            if (frame.fin)
                deliverMessage();
            return;

        case ws::Opcode::Continuation:
            if (!_inMessage)
            {
                fail(Error { ErrorCode::TransportError, "Unexpected WebSocket continuation frame" });
                return;
            }
            if (_message.size() + frame.payload.size() > ws::MaxPayloadSize)
            {
                fail(Error { ErrorCode::TransportError, "Fragmented WebSocket message is too large" });
                return;
            }
            _message.insert(_message.end(), frame.payload.begin(), frame.payload.end());
            if (frame.fin)
            {
                _inMessage = false;
                deliverMessage();
            }
            return;

        case ws::Opcode::Ping:
            if (auto sent = send(ws::Opcode::Pong, frame.payload); !sent)
                wsLog.debug("Cannot answer ping: {}", sent.error().message);
            return;

        case ws::Opcode::Pong: {
            auto onPong = _handler.onPong;
            if (onPong)
                onPong();
            return;
        }

        case ws::Opcode::Close:
            wsLog.debug("Server closed the connection");
            if (auto mask = ws::randomMask())
            {
                queueFrame(ws::encodeFrame(ws::Opcode::Close, ws::closePayload(ws::NormalClosure), *mask));
                _closeAfterFlush = true;
            }
            remoteClosed();
            return;
    }
}

void WebSocketTransport::Connection::deliverMessage()
{
    auto const message = std::exchange(_message, {});
    if (!_messageIsText)
    {
        wsLog.debug("Ignoring binary message of {} bytes", message.size());
        return;
    }

    auto onMessage = _handler.onMessage;
    if (onMessage)
        onMessage(std::string_view(reinterpret_cast<const char*>(message.data()), message.size()));
}

auto WebSocketTransport::Connection::send(ws::Opcode opcode, std::span<const std::uint8_t> payload) -> VoidResult
{
    if (_state != State::Open)
        return makeError(ErrorCode::TransportError, "WebSocket is not open");

    auto mask = ws::randomMask();
    if (!mask)
        return std::unexpected(mask.error());

    queueFrame(ws::encodeFrame(opcode, payload, *mask));
    return {};
}

void WebSocketTransport::Connection::queueFrame(std::vector<std::uint8_t> frame)
{
    _outbox.push_back(std::move(frame));
    if (!_writing)
        writeNext();
}

void WebSocketTransport::Connection::writeNext()
{
    if (_outbox.empty())
    {
        if (_closeAfterFlush)
            shutdownSocket();
        return;
    }

    _writing = true;
    withStream([&](auto& stream) {
        asio::async_write(stream,
                          asio::buffer(_outbox.front()),
                          [self = shared_from_this()](const boost::system::error_code& ec, std::size_t) {
                              self->_writing = false;
                              if (ec)
                              {
                                  if (self->_state == State::Open)
                                      self->fail(Error { ErrorCode::TransportError,
                                                         std::format("Write failed: {}", ec.message()) });
                                  else
                                      self->shutdownSocket();
                                  return;
                              }
                              if (!self->_outbox.empty())
                                  self->_outbox.pop_front();
                              self->writeNext();
                          });
    });
}

void WebSocketTransport::Connection::close()
{
    switch (_state)
    {
        case State::Open:
            _state = State::Closing;
            _handler = {};
            if (auto mask = ws::randomMask())
                queueFrame(ws::encodeFrame(ws::Opcode::Close, ws::closePayload(ws::NormalClosure), *mask));
            _closeAfterFlush = true;
            if (!_writing)
                writeNext();
            return;
        case State::Idle:
        case State::Connecting: terminate(); return;
        case State::Closing:
        case State::Closed: _handler = {}; return;
    }
}

void WebSocketTransport::Connection::terminate()
{
    _handler = {};
    _resolver.cancel();
    _outbox.clear();
    shutdownSocket();
}

void WebSocketTransport::Connection::postFailure(Error error)
{
    asio::post(_io, [self = shared_from_this(), error = std::move(error)]() mutable {
        if (self->_state == State::Connecting)
            self->fail(std::move(error));
    });
}

void WebSocketTransport::Connection::fail(Error error)
{
    if (_state == State::Closed)
        return;

    wsLog.debug("{}", error.message);
    auto handler = std::exchange(_handler, {});
    _outbox.clear();
    shutdownSocket();
    if (handler.onError)
        handler.onError(std::move(error));
}

void WebSocketTransport::Connection::remoteClosed()
{
    if (_state == State::Closed)
        return;

    auto handler = std::exchange(_handler, {});
    if (_closeAfterFlush && _writing)
        _state = State::Closing;
    else
        shutdownSocket();
    if (handler.onClose)
        handler.onClose();
}

void WebSocketTransport::Connection::shutdownSocket()
{
    _state = State::Closed;
    if (std::holds_alternative<std::monostate>(_stream))
        return;

    auto ec = boost::system::error_code {};
    socket().shutdown(tcp::socket::shutdown_both, ec);
    socket().close(ec);
}

// }}}

WebSocketTransport::WebSocketTransport(asio::io_context& io, asio::ssl::context& tls):
    _connection(std::make_shared<Connection>(io, tls))
{
}

WebSocketTransport::~WebSocketTransport()
{
    _connection->terminate();
}

void WebSocketTransport::open(std::string_view url, TransportHandler handler)
{
    _connection->open(url, std::move(handler));
}

auto WebSocketTransport::send(std::string_view text) -> VoidResult
{
    return _connection->send(ws::Opcode::Text,
                             std::span(reinterpret_cast<const std::uint8_t*>(text.data()), text.size()));
}

auto WebSocketTransport::ping() -> VoidResult
{
    return _connection->send(ws::Opcode::Ping, {});
}

void WebSocketTransport::close()
{
    _connection->close();
}

void WebSocketTransport::terminate()
{
    _connection->terminate();
}

auto WebSocketTransport::isOpen() const -> bool
{
    return _connection->isOpen();
}

auto WebSocketTransport::factory(asio::io_context& io, asio::ssl::context& tls) -> TransportFactory
{
    return [&io, &tls]() -> std::unique_ptr<Transport> { return std::make_unique<WebSocketTransport>(io, tls); };
}

auto WebSocketTransport::makeTlsContext() -> asio::ssl::context
{
    auto context = asio::ssl::context(asio::ssl::context::tls_client);
    context.set_options(asio::ssl::context::default_workarounds | asio::ssl::context::no_sslv2
                        | asio::ssl::context::no_sslv3);

    auto ec = boost::system::error_code {};
    context.set_default_verify_paths(ec);
    if (ec)
        wsLog.warning("Cannot load system CA certificates: {}", ec.message());
    return context;
}

} // namespace gatelink
