// /////////////////////////////////////////////////////////////////////////////
/// @file CaptureBridge.hpp
/// @brief Adapter forwarding capture-producer batches to the Transmitter.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <synapse/capture/ICaptureProducer.hpp>
#include <synapse/core/Expected.hpp>
#include <synapse/core/NonCopyable.hpp>
#include <synapse/core/Types.hpp>

#include <functional>
#include <memory>
#include <vector>

namespace synapse::net {
class ConnectionManager;
} // namespace synapse::net

namespace synapse::bridge {

class Transmitter;

// /////////////////////////////////////////////////////////////////////////////
/// @class CaptureBridge
/// @brief Owns the attached producer and sends each batch as one message.
///
/// No buffering, no coalescing.  A batch arriving while disconnected is
/// dropped and reported through the drop listener; any other send
/// failure goes to the transmit-error listener.
// /////////////////////////////////////////////////////////////////////////////
class CaptureBridge final : public core::NonCopyable<CaptureBridge>
{
public:
    using DropListener          = std::function<void(core::usize samples)>;
    using TransmitErrorListener = std::function<void(const core::Error& error)>;

    CaptureBridge(Transmitter& transmitter, net::ConnectionManager& connection);
    ~CaptureBridge();

    /// @brief Registers the batch callback on @p producer and starts it.
    /// @return kAlreadyRunning when a producer is attached, kInvalidArgument
    ///         for a null producer, or the producer's start() error.
    [[nodiscard]] core::Expected<void> attach(std::unique_ptr<capture::ICaptureProducer> producer);

    /// @brief Stops and releases the producer; no-op when detached.
    void detach() noexcept;

    [[nodiscard]] bool isAttached() const noexcept { return producer_ != nullptr; }
    [[nodiscard]] const capture::ICaptureProducer* producer() const noexcept { return producer_.get(); }

    void setDropListener(DropListener listener);
    void setTransmitErrorListener(TransmitErrorListener listener);

    [[nodiscard]] core::u64 batchesForwarded() const noexcept { return forwarded_; }
    [[nodiscard]] core::u64 batchesDropped()   const noexcept { return dropped_; }

private:
    void onBatch(std::vector<stream::Sample> batch);

    Transmitter&                               transmitter_;
    net::ConnectionManager&                    connection_;
    std::unique_ptr<capture::ICaptureProducer> producer_;
    DropListener                               dropListener_;
    TransmitErrorListener                      errorListener_;
    core::u64                                  forwarded_{0};
    core::u64                                  dropped_{0};
};

} // namespace synapse::bridge
