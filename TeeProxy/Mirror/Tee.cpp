#include "Tee.hpp"
#include <precompiled.hpp>
#include <Configuration/Duration.hpp>
#include <Logging/Logging.hpp>

using LogLevel = TeeProxy::Logging::Level;

namespace TeeProxy::Mirror
{
    template<typename... Arguments>
    void logLine(LogLevel level, Arguments&&... arguments)
    {
        return Logging::logLine<Tee>(level, std::forward<Arguments>(arguments)...);
    }

    template<typename Handler>
    void Tee::failLater(Handler handler)
    {
        boost::asio::post(*m_strand, [handler = std::move(handler)]
        {
            handler(boost::asio::error::operation_aborted, 0);
        });
    }

    std::shared_ptr<Tee::Pool> Tee::createPool(std::size_t const capacity)
    {
        return Pool::create([] { return std::make_unique<Tee>(PrivateConstructor{}); }, capacity);
    }

    std::shared_ptr<Tee> Tee::create
    (
        Pool& pool,
        Strand const& strand,
        std::shared_ptr<Stream> production,
        std::shared_ptr<Stream> shadow,
        Options const& options
    )
    {
        auto const self = pool.acquire();
        self->open(strand, std::move(production), std::move(shadow), options);
        self->readFromShadow();
        return self;
    }

    Tee::Tee(PrivateConstructor) :
        m_state{ State::closed },
        m_scratch(scratchSize),
        m_mirroring{ false },
        m_shadowWriteInFlight{ false },
        m_shadowReadFinished{ true }
    {}

    void Tee::open
    (
        Strand const& strand,
        std::shared_ptr<Stream> production,
        std::shared_ptr<Stream> shadow,
        Options const& options
    )
    {
        if (!production || !shadow)
        {
            throw std::invalid_argument{ "Tee: both streams are required" };
        }

        m_strand.emplace(strand);
        m_lingerTimer.emplace(strand);
        m_production = std::move(production);
        m_shadow = std::move(shadow);
        m_options = options;
        m_pendingShadowWrite.clear();
        m_inFlightShadowWrite.clear();
        m_mirroring = true;
        m_shadowWriteInFlight = false;
        m_shadowReadFinished = false;
        m_statistics = Statistics{};
        m_state = State::open;
    }

    void Tee::reset()
    {
        m_lingerTimer.reset();
        m_strand.reset();
        m_production.reset();
        m_shadow.reset();
        // Keep the capacity for the next connection.
        m_pendingShadowWrite.clear();
        m_inFlightShadowWrite.clear();
        m_mirroring = false;
        m_shadowWriteInFlight = false;
        m_shadowReadFinished = true;
    }

    bool Tee::isReusable() const noexcept
    {
        return m_state == State::closed;
    }

    Tee::State Tee::getState() const noexcept
    {
        return m_state;
    }

    Tee::Statistics Tee::getStatistics() const noexcept
    {
        auto statistics = m_statistics;
        statistics.mirroring = m_mirroring;
        return statistics;
    }

    void Tee::asyncReadSome(MutableBuffer const buffer, ReadHandler handler)
    {
        if (m_state != State::open)
        {
            return failLater(std::move(handler));
        }
        // B is read by readFromShadow(), never on behalf of the caller.
        m_production->asyncReadSome(buffer, std::move(handler));
    }

    void Tee::asyncWrite(ConstBuffer const buffer, WriteHandler handler)
    {
        if (m_state != State::open)
        {
            return failLater(std::move(handler));
        }
        mirrorToShadow(buffer);
        m_production->asyncWrite(buffer, std::move(handler));
    }

    Tee::ErrorCode Tee::close()
    {
        auto expected = State::open;
        if (!m_state.compare_exchange_strong(expected, State::closing))
        {
            return ErrorCode{};
        }

        auto const code = m_production->close();
        boost::asio::dispatch(*m_strand, [self = shared_from_this()] { self->startDrain(); });
        return code;
    }

    void Tee::mirrorToShadow(ConstBuffer const buffer)
    {
        if (!m_mirroring || buffer.size() == 0)
        {
            return;
        }

        auto const queued = m_pendingShadowWrite.size() + m_inFlightShadowWrite.size();
        if (queued + buffer.size() > m_options.shadowBacklogLimit)
        {
            return stopMirroring("backlog limit reached");
        }

        auto const data = static_cast<std::byte const*>(buffer.data());
        m_pendingShadowWrite.insert(m_pendingShadowWrite.end(), data, data + buffer.size());

        if (!m_shadowWriteInFlight)
        {
            flushToShadow();
        }
    }

    void Tee::flushToShadow()
    {
        if (m_pendingShadowWrite.empty() || !m_mirroring)
        {
            return;
        }

        std::swap(m_pendingShadowWrite, m_inFlightShadowWrite);
        m_pendingShadowWrite.clear();
        m_shadowWriteInFlight = true;

        m_shadow->asyncWrite
        (
            boost::asio::buffer(m_inFlightShadowWrite),
            [self = shared_from_this()](ErrorCode const& code, std::size_t)
            {
                self->onShadowWritten(code);
            }
        );
    }

    void Tee::onShadowWritten(ErrorCode const& code)
    {
        m_shadowWriteInFlight = false;
        if (code.failed())
        {
            return stopMirroring(code.message());
        }

        m_statistics.bytesMirrored += m_inFlightShadowWrite.size();
        m_inFlightShadowWrite.clear();
        flushToShadow();
    }

    void Tee::stopMirroring(std::string_view const reason)
    {
        if (!m_mirroring)
        {
            return;
        }
        m_mirroring = false;
        m_pendingShadowWrite.clear();
        logLine(LogLevel::debug, "Stopped mirroring to b: ", reason);
    }

    void Tee::readFromShadow()
    {
        m_shadow->asyncReadSome
        (
            boost::asio::buffer(m_scratch),
            [self = shared_from_this()](ErrorCode const& code, std::size_t const bytesRead)
            {
                self->onShadowRead(code, bytesRead);
            }
        );
    }

    void Tee::onShadowRead(ErrorCode const& code, std::size_t const bytesRead)
    {
        if (code.failed())
        {
            // End of stream and errors are the same thing for B.
            m_shadowReadFinished = true;
            if (code != boost::asio::error::operation_aborted)
            {
                logLine(LogLevel::debug, "b stopped sending: ", code.message());
            }
            if (m_state == State::closing)
            {
                finishDrain("b closed connection");
            }
            return;
        }

        m_statistics.bytesDiscarded += bytesRead;
        readFromShadow();
    }

    void Tee::startDrain()
    {
        logLine(LogLevel::debug, "Lingering up to ", Configuration::formatDuration(m_options.linger), " for b to disconnect");

        if (m_shadowReadFinished)
        {
            return finishDrain("b already disconnected");
        }

        auto const onLingerExpired = [self = shared_from_this()](ErrorCode const& code)
        {
            if (code == boost::asio::error::operation_aborted)
            {
                return;
            }
            if (code.failed())
            {
                logLine(LogLevel::error, "Linger wait failed: ", code.message());
            }
            self->finishDrain("forcing b closed");
        };
        m_lingerTimer->asyncWait(m_options.linger, onLingerExpired);
    }

    void Tee::finishDrain(std::string_view const reason)
    {
        auto expected = State::closing;
        if (!m_state.compare_exchange_strong(expected, State::closed))
        {
            return;
        }

        logLine(LogLevel::debug, reason);
        m_lingerTimer->get().cancel();

        auto const code = m_shadow->close();
        if (code.failed())
        {
            logLine(LogLevel::debug, "Closing b failed: ", code.message());
        }

        logLine
        (
            LogLevel::debug,
            "Finished draining tee, mirrored ", m_statistics.bytesMirrored,
            " bytes, discarded ", m_statistics.bytesDiscarded, " bytes"
        );
    }
}
