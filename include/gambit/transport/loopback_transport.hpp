#pragma once
#include "gambit/transport/i_transport_channel.hpp"
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>

namespace gambit::transport {

class LoopbackTransport;

/**
 * In-process rendezvous and event queue for LoopbackTransport endpoints.
 *
 * Endpoints are paired by the session token of an offer. Frames and state
 * changes are queued in order and only delivered by Pump(), so observers
 * never run re-entrantly inside Send().
 */
class LoopbackHub {
public:
    [[nodiscard]] static std::shared_ptr<LoopbackHub> Create();

    /// Delivers queued events, including any queued during delivery. Returns the number delivered.
    size_t Pump();

    [[nodiscard]] size_t PendingCount() const;

    LoopbackHub(const LoopbackHub&) = delete;
    LoopbackHub& operator=(const LoopbackHub&) = delete;

private:
    friend class LoopbackTransport;

    struct Event {
        uint64_t target = 0;
        std::variant<std::string, ConnectionState> payload;
    };

    LoopbackHub() = default;

    uint64_t Register(LoopbackTransport* endpoint);
    void Unregister(uint64_t endpoint_id);
    void PublishOffer(const std::string& token, uint64_t endpoint_id);
    [[nodiscard]] std::optional<uint64_t> TakeOffer(const std::string& token);
    [[nodiscard]] bool IsRegistered(uint64_t endpoint_id) const;
    void Enqueue(uint64_t target, std::variant<std::string, ConnectionState> payload);

    mutable std::mutex lock_;
    uint64_t next_endpoint_id_ = 1;
    std::map<uint64_t, LoopbackTransport*> endpoints_;
    std::map<std::string, uint64_t> open_offers_;
    std::deque<Event> queue_;
};

/**
 * ITransportChannel endpoint attached to a LoopbackHub.
 *
 * Host: CreateOffer() then ApplyAnswer(); joiner: AcceptOffer(). Both sides
 * see Connected once the host applies the answer.
 */
class LoopbackTransport final : public ITransportChannel {
public:
    explicit LoopbackTransport(std::shared_ptr<LoopbackHub> hub);
    ~LoopbackTransport() override;

    LoopbackTransport(const LoopbackTransport&) = delete;
    LoopbackTransport& operator=(const LoopbackTransport&) = delete;

    [[nodiscard]] Result<SignalingPackage, ProtocolFailure> CreateOffer() override;
    [[nodiscard]] Result<SignalingPackage, ProtocolFailure> AcceptOffer(const SignalingPackage& offer) override;
    [[nodiscard]] Result<Unit, ProtocolFailure> ApplyAnswer(const SignalingPackage& answer) override;
    [[nodiscard]] Result<Unit, ProtocolFailure> Send(std::string frame) override;
    void SetObserver(ITransportObserver* observer) override;
    [[nodiscard]] Result<Unit, ProtocolFailure> Close() override;
    [[nodiscard]] ConnectionState GetState() const override;

    /// Reports Failed to this endpoint and Disconnected to its peer.
    void SimulateFailure();

private:
    friend class LoopbackHub;

    void Deliver(const LoopbackHub::Event& event);
    [[nodiscard]] std::string EndpointName() const;
    [[nodiscard]] SignalingPackage MakePackage(SignalingPackage::Kind kind, std::vector<uint8_t> token) const;

    std::shared_ptr<LoopbackHub> hub_;
    uint64_t endpoint_id_ = 0;
    mutable std::mutex lock_;
    ConnectionState state_ = ConnectionState::Idle;
    std::optional<uint64_t> peer_id_;
    std::vector<uint8_t> session_token_;
    ITransportObserver* observer_ = nullptr;
};

}
