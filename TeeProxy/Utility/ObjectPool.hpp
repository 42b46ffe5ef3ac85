#pragma once
#include "precompiled.hpp"

namespace TeeProxy::Utility
{
    // Thread safe cache of reusable objects.
    //
    // T must provide:
    //   bool isReusable() const;  // true once the object finished its previous use
    //   void reset();             // drops per-use state before the object goes idle
    //
    // acquire() hands out a shared_ptr whose deleter gives the object back through
    // release(), so an object becomes idle exactly once per acquisition, and only
    // after its last owner let go of it.
    template<typename T>
    class ObjectPool : public std::enable_shared_from_this<ObjectPool<T>>
    {
    public:
        using Factory = std::function<std::unique_ptr<T>()>;

        struct Statistics
        {
            std::size_t allocated = 0;
            std::size_t reused = 0;
            std::size_t discarded = 0;
            std::size_t idle = 0;
        };

    private:
        struct PrivateConstructor {};

    private:
        Factory m_factory;
        std::size_t m_capacity;
        std::mutex mutable m_mutex;
        std::vector<std::unique_ptr<T>> m_idle;
        Statistics m_statistics;

    public:
        static constexpr auto description = "ObjectPool";

        static std::shared_ptr<ObjectPool> create(Factory factory, std::size_t const capacity)
        {
            return std::make_shared<ObjectPool>(PrivateConstructor{}, std::move(factory), capacity);
        }

        ObjectPool(PrivateConstructor, Factory factory, std::size_t const capacity) :
            m_factory{ std::move(factory) },
            m_capacity{ capacity }
        {
            if (!m_factory)
            {
                throw std::invalid_argument{ "ObjectPool: factory is empty" };
            }
        }

        std::shared_ptr<T> acquire()
        {
            auto object = std::unique_ptr<T>{};
            {
                auto const lock = std::scoped_lock{ m_mutex };
                if (!m_idle.empty())
                {
                    object = std::move(m_idle.back());
                    m_idle.pop_back();
                    ++m_statistics.reused;
                }
            }

            if (!object)
            {
                object = m_factory();
                auto const lock = std::scoped_lock{ m_mutex };
                ++m_statistics.allocated;
            }

            auto deleter = [pool = this->weak_from_this()](T* const pointer)
            {
                auto owned = std::unique_ptr<T>{ pointer };
                if (auto const self = pool.lock())
                {
                    self->release(std::move(owned));
                }
            };
            return std::shared_ptr<T>{ object.release(), std::move(deleter) };
        }

        // Objects that are not reusable, or that do not fit, are destroyed.
        void release(std::unique_ptr<T> object)
        {
            if (!object)
            {
                return;
            }

            if (!object->isReusable())
            {
                auto const lock = std::scoped_lock{ m_mutex };
                ++m_statistics.discarded;
                return;
            }

            object->reset();

            auto const lock = std::scoped_lock{ m_mutex };
            if (m_idle.size() >= m_capacity)
            {
                ++m_statistics.discarded;
                return;
            }
            m_idle.push_back(std::move(object));
        }

        Statistics getStatistics() const
        {
            auto const lock = std::scoped_lock{ m_mutex };
            auto statistics = m_statistics;
            statistics.idle = m_idle.size();
            return statistics;
        }
    };
}
