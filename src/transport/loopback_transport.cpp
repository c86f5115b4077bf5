#include "gambit/transport/loopback_transport.hpp"
#include "gambit/crypto/sodium_interop.hpp"
#include "gambit/core/constants.hpp"
#include "gambit/core/format.hpp"
#include "gambit/debug/session_logger.hpp"
#include <charconv>

namespace gambit::transport {
using crypto::SodiumInterop;

namespace {
    std::string TokenKey(const std::vector<uint8_t>& token) {
        return {token.begin(), token.end()};
    }
}

// ============================================================================
// LoopbackHub
// ============================================================================

std::shared_ptr<LoopbackHub> LoopbackHub::Create() {
    return std::shared_ptr<LoopbackHub>(new LoopbackHub());
}

uint64_t LoopbackHub::Register(LoopbackTransport* endpoint) {
    std::lock_guard guard(lock_);
    const uint64_t id = next_endpoint_id_++;
    endpoints_[id] = endpoint;
    return id;
}

void LoopbackHub::Unregister(const uint64_t endpoint_id) {
    std::lock_guard guard(lock_);
    endpoints_.erase(endpoint_id);
    for (auto it = open_offers_.begin(); it != open_offers_.end();) {
        it = it->second == endpoint_id ? open_offers_.erase(it) : std::next(it);
    }
}

void LoopbackHub::PublishOffer(const std::string& token, const uint64_t endpoint_id) {
    std::lock_guard guard(lock_);
    open_offers_[token] = endpoint_id;
}

std::optional<uint64_t> LoopbackHub::TakeOffer(const std::string& token) {
    std::lock_guard guard(lock_);
    const auto it = open_offers_.find(token);
    if (it == open_offers_.end()) {
        return std::nullopt;
    }
    const uint64_t host = it->second;
    open_offers_.erase(it);
    return host;
}

bool LoopbackHub::IsRegistered(const uint64_t endpoint_id) const {
    std::lock_guard guard(lock_);
    return endpoints_.find(endpoint_id) != endpoints_.end();
}

void LoopbackHub::Enqueue(const uint64_t target, std::variant<std::string, ConnectionState> payload) {
    std::lock_guard guard(lock_);
    queue_.push_back(Event{target, std::move(payload)});
}

size_t LoopbackHub::Pump() {
    size_t delivered = 0;
    while (true) {
        Event event;
        LoopbackTransport* target = nullptr;
        {
            std::lock_guard guard(lock_);
            if (queue_.empty()) {
                break;
            }
            event = std::move(queue_.front());
            queue_.pop_front();
            const auto it = endpoints_.find(event.target);
            if (it == endpoints_.end()) {
                continue;
            }
            target = it->second;
        }
        target->Deliver(event);
        ++delivered;
    }
    return delivered;
}

size_t LoopbackHub::PendingCount() const {
    std::lock_guard guard(lock_);
    return queue_.size();
}

// ============================================================================
// LoopbackTransport
// ============================================================================

LoopbackTransport::LoopbackTransport(std::shared_ptr<LoopbackHub> hub)
    : hub_(std::move(hub)) {
    endpoint_id_ = hub_->Register(this);
}

LoopbackTransport::~LoopbackTransport() {
    hub_->Unregister(endpoint_id_);
}

std::string LoopbackTransport::EndpointName() const {
    return compat::format("loopback-{}", endpoint_id_);
}

SignalingPackage LoopbackTransport::MakePackage(
    const SignalingPackage::Kind kind,
    std::vector<uint8_t> token) const {
    SignalingPackage package;
    package.kind = kind;
    package.session_token = std::move(token);
    package.endpoint_id = EndpointName();
    package.candidates.push_back(compat::format("loopback://{}", endpoint_id_));
    return package;
}

Result<SignalingPackage, ProtocolFailure> LoopbackTransport::CreateOffer() {
    using PackageResult = Result<SignalingPackage, ProtocolFailure>;
    std::vector<uint8_t> token;
    {
        std::lock_guard guard(lock_);
        if (state_ != ConnectionState::Idle) {
            return PackageResult::Err(
                ProtocolFailure::InvalidState(
                    compat::format("Cannot create offer in state {}", ToString(state_))));
        }
        token = SodiumInterop::GetRandomBytes(kSessionTokenBytes);
        session_token_ = token;
        state_ = ConnectionState::Connecting;
    }
    hub_->PublishOffer(TokenKey(token), endpoint_id_);
    return PackageResult::Ok(MakePackage(SignalingPackage::Kind::Offer, std::move(token)));
}

Result<SignalingPackage, ProtocolFailure> LoopbackTransport::AcceptOffer(const SignalingPackage& offer) {
    using PackageResult = Result<SignalingPackage, ProtocolFailure>;
    if (offer.kind != SignalingPackage::Kind::Offer) {
        return PackageResult::Err(ProtocolFailure::InvalidInput("Expected an offer package"));
    }
    std::lock_guard guard(lock_);
    if (state_ != ConnectionState::Idle) {
        return PackageResult::Err(
            ProtocolFailure::InvalidState(
                compat::format("Cannot accept offer in state {}", ToString(state_))));
    }
    const auto host = hub_->TakeOffer(TokenKey(offer.session_token));
    if (!host.has_value()) {
        return PackageResult::Err(ProtocolFailure::Transport("Offer is unknown or already answered"));
    }
    peer_id_ = *host;
    session_token_ = offer.session_token;
    state_ = ConnectionState::Connecting;
    return PackageResult::Ok(MakePackage(SignalingPackage::Kind::Answer, offer.session_token));
}

Result<Unit, ProtocolFailure> LoopbackTransport::ApplyAnswer(const SignalingPackage& answer) {
    if (answer.kind != SignalingPackage::Kind::Answer) {
        return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::InvalidInput("Expected an answer package"));
    }
    uint64_t joiner = 0;
    {
        std::lock_guard guard(lock_);
        if (state_ != ConnectionState::Connecting || peer_id_.has_value()) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidState("No outstanding offer to apply an answer to"));
        }
        if (answer.session_token != session_token_) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::Transport("Answer does not match the outstanding offer"));
        }
        constexpr std::string_view kPrefix = "loopback://";
        if (answer.candidates.empty() || answer.candidates.front().rfind(kPrefix, 0) != 0) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::Transport("Answer carries no loopback candidate"));
        }
        const std::string& candidate = answer.candidates.front();
        const char* first = candidate.data() + kPrefix.size();
        const char* last = candidate.data() + candidate.size();
        const auto [ptr, ec] = std::from_chars(first, last, joiner);
        if (ec != std::errc() || ptr != last) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::Transport("Malformed loopback candidate"));
        }
        if (!hub_->IsRegistered(joiner)) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::Transport("Answering endpoint is gone"));
        }
        peer_id_ = joiner;
    }
    hub_->Enqueue(endpoint_id_, ConnectionState::Connected);
    hub_->Enqueue(joiner, ConnectionState::Connected);
    GAMBIT_LOG_VALUE(debug::Side::Host, "TRANSPORT", "paired_endpoint", joiner);
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

Result<Unit, ProtocolFailure> LoopbackTransport::Send(std::string frame) {
    uint64_t peer = 0;
    {
        std::lock_guard guard(lock_);
        if (state_ != ConnectionState::Connected || !peer_id_.has_value()) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::Transport(std::string(ErrorMessages::NOT_CONNECTED)));
        }
        peer = *peer_id_;
    }
    hub_->Enqueue(peer, std::move(frame));
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

void LoopbackTransport::SetObserver(ITransportObserver* observer) {
    std::lock_guard guard(lock_);
    observer_ = observer;
}

Result<Unit, ProtocolFailure> LoopbackTransport::Close() {
    std::optional<uint64_t> peer;
    {
        std::lock_guard guard(lock_);
        if (state_ == ConnectionState::Disconnected) {
            return Result<Unit, ProtocolFailure>::Ok(unit);
        }
        const bool notify_peer = state_ == ConnectionState::Connected;
        state_ = ConnectionState::Disconnected;
        if (notify_peer) {
            peer = peer_id_;
        }
        peer_id_.reset();
    }
    if (peer.has_value()) {
        hub_->Enqueue(*peer, ConnectionState::Disconnected);
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

ConnectionState LoopbackTransport::GetState() const {
    std::lock_guard guard(lock_);
    return state_;
}

void LoopbackTransport::SimulateFailure() {
    std::optional<uint64_t> peer;
    {
        std::lock_guard guard(lock_);
        peer = peer_id_;
    }
    hub_->Enqueue(endpoint_id_, ConnectionState::Failed);
    if (peer.has_value()) {
        hub_->Enqueue(*peer, ConnectionState::Disconnected);
    }
}

void LoopbackTransport::Deliver(const LoopbackHub::Event& event) {
    ITransportObserver* observer = nullptr;
    if (const auto* state = std::get_if<ConnectionState>(&event.payload)) {
        {
            std::lock_guard guard(lock_);
            // A locally closed endpoint ignores late state reports.
            if (state_ == ConnectionState::Disconnected || state_ == ConnectionState::Failed) {
                return;
            }
            state_ = *state;
            if (*state != ConnectionState::Connected) {
                peer_id_.reset();
            }
            observer = observer_;
        }
        if (observer != nullptr) {
            observer->OnConnectionStateChanged(*state);
        }
        return;
    }

    {
        std::lock_guard guard(lock_);
        if (state_ != ConnectionState::Connected) {
            return;
        }
        observer = observer_;
    }
    if (observer != nullptr) {
        observer->OnFrameReceived(std::get<std::string>(event.payload));
    }
}

}
