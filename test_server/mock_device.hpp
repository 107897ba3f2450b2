/**
 * @file mock_device.hpp
 * @brief State of the fake power switch behind cmdrelay_mock_device.
 *
 * Shared by every connection the server accepts. A msg_id that was already
 * applied is acknowledged from the device's own IdempotencyCache without
 * toggling again.
 *
 * @date 2025
 */
#pragma once
#include "cmdrelay/core/cache/idempotency_cache.hpp"
#include "cmdrelay/core/interfaces/ipayload_codec.hpp"
#include "cmdrelay/core/util/hex.hpp"
#include "cmdrelay/core/util/logger.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <format>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace cmdrelay::mock {

    struct MockConfig {
        uint16_t    port{ 9000 };
        std::string deviceId;           ///< empty: answer for any device id
        uint32_t    dropFirst{ 0 };
        uint32_t    delayMs{ 0 };
        bool        nack{ false };
        PayloadFormat format{ PayloadFormat::Json };
        std::string logLevel{ "info" };
    };

    class MockDevice {
    public:
        explicit MockDevice(MockConfig cfg)
            : cfg_(std::move(cfg)),
              codec_(makePayloadCodec(cfg_.format)),
              cache_(std::make_shared<IdempotencyCache>()) {}

        /// Handle one request payload; returns the response payload, or nullopt to stay silent.
        std::optional<std::vector<uint8_t>> handle(const std::vector<uint8_t>& payload) {
            auto req = codec_->decodeRequest(payload);
            if (!req) {
                LOG_WARN(std::format("undecodable request ({} bytes): {}", payload.size(), hexDump(payload)));
                return std::nullopt;
            }

            const uint64_t n = ++requests_;
            LOG_INFO(std::format("request #{} {} device={} msg={} state={}",
                n, toString(req->opcode), req->deviceId, req->msgId, req->state));

            if (cfg_.delayMs > 0)
                std::this_thread::sleep_for(std::chrono::milliseconds(cfg_.delayMs));

            DeviceResponse rsp;
            rsp.opcode = req->opcode;
            rsp.deviceId = req->deviceId;
            rsp.msgId = req->msgId;

            if (cfg_.nack) {
                rsp.ack = false;
                rsp.error = "rejected by mock device";
                return codec_->encodeResponse(rsp);
            }
            if (!cfg_.deviceId.empty() && req->deviceId != cfg_.deviceId) {
                rsp.ack = false;
                rsp.error = std::format("unknown device {}", req->deviceId);
                return codec_->encodeResponse(rsp);
            }

            {
                // lookup and record as one step: the same msg_id may arrive on two connections
                std::scoped_lock lk(applyMx_);
                if (cache_->lookup(req->msgId) == Outcome::Success) {
                    LOG_INFO(std::format("msg {} already applied, acknowledging without toggling", req->msgId));
                }
                else {
                    if (req->opcode == Opcode::Toggle) {
                        powered_ = req->state;
                        ++toggles_;
                        LOG_INFO(std::format("power -> {}", req->state ? "on" : "off"));
                    }
                    cache_->record(req->msgId, Outcome::Success);
                }
                rsp.state = powered_;
            }

            if (n <= cfg_.dropFirst) {
                LOG_INFO(std::format("dropping response to request #{}", n));
                return std::nullopt;
            }

            rsp.ack = true;
            return codec_->encodeResponse(rsp);
        }

        /// Toggle requests actually applied (duplicates excluded).
        uint64_t toggles() const {
            std::scoped_lock lk(applyMx_);
            return toggles_;
        }

        bool powered() const {
            std::scoped_lock lk(applyMx_);
            return powered_;
        }

    private:
        MockConfig cfg_;
        std::shared_ptr<IPayloadCodec> codec_;
        std::shared_ptr<IdempotencyCache> cache_;
        std::atomic<uint64_t> requests_{ 0 };

        mutable std::mutex applyMx_;
        bool powered_{ false };         ///< guarded by applyMx_
        uint64_t toggles_{ 0 };         ///< guarded by applyMx_
    };

}
