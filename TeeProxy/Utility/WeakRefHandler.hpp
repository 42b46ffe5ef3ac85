#pragma once
#include "precompiled.hpp"
#include <Logging/Logging.hpp>

namespace TeeProxy::Utility
{
    template<typename Type, typename Handler>
    class WeakRefHandler
    {
    private:
        std::weak_ptr<Type> m_ref;
        Handler m_handler;

    public:
        template<typename InputHandler>
        WeakRefHandler(std::weak_ptr<Type> const& ref, InputHandler&& handler) :
            m_ref{ ref },
            m_handler{ std::forward<InputHandler>(handler) } 
        {}

        template<typename... Arguments>
        void operator()(Arguments&&... arguments)
        {
            using namespace Logging;

            auto const self = m_ref.lock();
            if (!self)
            {
                logLine<Type>(Level::debug, "Deferred action dropped, owner already destroyed");
                return;
            }

            std::invoke(m_handler, *self, std::forward<Arguments>(arguments)...);
        }
    };

    template<typename T, typename Handler>
    auto makeWeakHandler(std::shared_ptr<T> const& pointer, Handler&& handler)
    {
        using HandlerValue = std::remove_cv_t<std::remove_reference_t<Handler>>;
        return WeakRefHandler<T, HandlerValue>{ pointer, std::forward<Handler>(handler) };
    }

    template<typename T, typename Handler>
    auto makeWeakHandler(T* pointer, Handler&& handler)
    {
        using HandlerValue = std::remove_cv_t<std::remove_reference_t<Handler>>;
        return WeakRefHandler<T, HandlerValue>{ pointer->weak_from_this(), std::forward<Handler>(handler) };
    }
}
