#pragma once
#include <precompiled.hpp>
#include <IOManager.hpp>
#include <Mirror/Stream.hpp>
#include <Utility/ObjectPool.hpp>
#include <Utility/WithStrand.hpp>

namespace TeeProxy::Mirror
{
    // Duplex stream over a production stream (A) and a shadow stream (B).
    //
    // Writes go to B in the background and to A; the caller only ever sees A's
    // result. Reads are served by A alone while B is read and discarded by a
    // background loop. close() closes A immediately, then drains B for at most
    // the linger period before closing it; the instance returns to its pool once
    // that is done and nobody references it anymore.
    class Tee final : public Stream, public std::enable_shared_from_this<Tee>
    {
    public:
        using Strand = IOManager::StrandType;
        using Timer = Utility::WithStrand<boost::asio::steady_timer>;
        using Pool = Utility::ObjectPool<Tee>;
        using Buffer = std::vector<std::byte>;

        enum class State
        {
            open,
            closing,
            closed
        };

        struct Options
        {
            std::chrono::nanoseconds linger = std::chrono::milliseconds{ 200 };
            // Largest amount of data waiting for B before mirroring is abandoned.
            std::size_t shadowBacklogLimit = 4 * 1024 * 1024;
        };

        struct Statistics
        {
            std::size_t bytesMirrored = 0;
            std::size_t bytesDiscarded = 0;
            bool mirroring = false;
        };

    private:
        struct PrivateConstructor {};

    public:
        static constexpr auto description = "Tee";
        static constexpr auto scratchSize = std::size_t{ 64 * 1024 };

    private:
        std::atomic<State> m_state;
        std::optional<Strand> m_strand;
        std::optional<Timer> m_lingerTimer;
        std::shared_ptr<Stream> m_production;
        std::shared_ptr<Stream> m_shadow;
        Options m_options;
        Buffer m_pendingShadowWrite;
        Buffer m_inFlightShadowWrite;
        Buffer m_scratch;
        bool m_mirroring;
        bool m_shadowWriteInFlight;
        bool m_shadowReadFinished;
        Statistics m_statistics;

    public:
        static std::shared_ptr<Pool> createPool(std::size_t capacity);

        // Must be called on `strand`, which both streams are bound to.
        static std::shared_ptr<Tee> create
        (
            Pool& pool,
            Strand const& strand,
            std::shared_ptr<Stream> production,
            std::shared_ptr<Stream> shadow,
            Options const& options
        );

        explicit Tee(PrivateConstructor);

        void asyncReadSome(MutableBuffer buffer, ReadHandler handler) override;

        void asyncWrite(ConstBuffer buffer, WriteHandler handler) override;

        ErrorCode close() override;

        State getState() const noexcept;

        Statistics getStatistics() const noexcept;

        bool isReusable() const noexcept;

        void reset();

    private:
        void open
        (
            Strand const& strand,
            std::shared_ptr<Stream> production,
            std::shared_ptr<Stream> shadow,
            Options const& options
        );

        void mirrorToShadow(ConstBuffer buffer);

        void flushToShadow();

        void onShadowWritten(ErrorCode const& code);

        void stopMirroring(std::string_view reason);

        void readFromShadow();

        void onShadowRead(ErrorCode const& code, std::size_t bytesRead);

        void startDrain();

        void finishDrain(std::string_view reason);

        template<typename Handler>
        void failLater(Handler handler);
    };
}
