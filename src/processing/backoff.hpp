#ifndef CALCFLOW_PROCESSING_BACKOFF_HPP
#define CALCFLOW_PROCESSING_BACKOFF_HPP

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace calcflow::processing
{
    /**
     * @brief Exponential backoff: initial, initial * factor, ... capped at max
     */
    class Backoff
    {
    public:
        Backoff( std::chrono::milliseconds initial, double factor, std::chrono::milliseconds max ) :
            m_initial( initial ), m_factor( factor ), m_max( max ), m_next( initial )
        {
        }

        /// @return delay to wait now, and grows the following one
        std::chrono::milliseconds Next()
        {
            auto current = std::min( m_next, m_max );
            auto grown   = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::duration<double, std::milli>( static_cast<double>( current.count() ) * m_factor ) );
            m_next = std::min( grown, m_max );
            return current;
        }

        void Reset()
        {
            m_next = m_initial;
        }

    private:
        std::chrono::milliseconds m_initial;
        double                    m_factor;
        std::chrono::milliseconds m_max;
        std::chrono::milliseconds m_next;
    };

    /**
     * @brief Cooperative stop signal shared by a runner and its drivers
     */
    class StopSource
    {
    public:
        void RequestStop()
        {
            {
                std::lock_guard<std::mutex> lock( m_mutex );
                m_stopped = true;
            }
            m_cv.notify_all();
        }

        bool StopRequested() const
        {
            std::lock_guard<std::mutex> lock( m_mutex );
            return m_stopped;
        }

        /**
         * @brief Sleeps for @param duration unless a stop is requested
         * @return false if the wait was cut short by a stop request
         */
        template <typename Rep, typename Period>
        bool WaitFor( std::chrono::duration<Rep, Period> duration ) const
        {
            std::unique_lock<std::mutex> lock( m_mutex );
            return !m_cv.wait_for( lock, duration, [this] { return m_stopped; } );
        }

    private:
        mutable std::mutex              m_mutex;
        mutable std::condition_variable m_cv;
        bool                            m_stopped = false;
    };
}

#endif
