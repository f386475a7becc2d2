#include "platform.h"

#include <chrono>
#include <iterator>

namespace vellum
{
    static double SteadyClockMs()
    {
        using namespace std::chrono;
        return (double)duration_cast<microseconds>(steady_clock::now().time_since_epoch()).count() / 1000.0;
    }

    double IPlatform::Now() const
    {
        return SteadyClockMs();
    }

    FrameScheduler::FrameScheduler(IPlatform* p, int32_t intervalMs)
        : platform{ p }, interval{ std::max(intervalMs, 0) }
    {}

    bool FrameScheduler::UsesTimerFallback() const
    {
        return platform == nullptr || !platform->DrivesFrames();
    }

    double FrameScheduler::Now() const
    {
        return platform != nullptr ? platform->Now() : SteadyClockMs();
    }

    int32_t FrameScheduler::RequestFrame(FrameCallbackT callback)
    {
        auto& entry = pending.emplace_back();
        entry.id = nextId++;
        entry.callback = std::move(callback);

        if (UsesTimerFallback())
        {
            auto currTime = Now();
            auto timeToCall = std::max(0.0, (double)interval - (currTime - lastTime));
            entry.due = currTime + timeToCall;
            lastTime = currTime + timeToCall;
        }

        return entry.id;
    }

    bool FrameScheduler::CancelFrame(int32_t id)
    {
        auto it = std::find_if(pending.begin(), pending.end(), [id](const Entry& entry) { return entry.id == id; });
        if (it != pending.end())
        {
            pending.erase(it);
            return true;
        }

        // Cancelling a sibling from inside a running batch
        if (running != nullptr)
        {
            for (auto& entry : *running)
            {
                if (entry.id == id && entry.callback)
                {
                    entry.callback = nullptr;
                    return true;
                }
            }
        }

        return false;
    }

    int FrameScheduler::Run(std::vector<Entry>& batch, std::optional<double> timestamp)
    {
        auto count = 0;
        running = &batch;

        for (auto idx = 0; idx < (int)batch.size(); ++idx)
        {
            if (!batch[idx].callback) continue;

            auto callback = std::move(batch[idx].callback);
            batch[idx].callback = nullptr;

            try
            {
                callback(timestamp.value_or(batch[idx].due));
            }
            catch (...)
            {
                // Callbacks after the failing one run with the next batch, ahead of newer requests
                running = nullptr;
                std::vector<Entry> remaining;
                std::copy_if(std::make_move_iterator(batch.begin() + idx + 1), std::make_move_iterator(batch.end()),
                    std::back_inserter(remaining), [](const Entry& entry) { return (bool)entry.callback; });
                pending.insert(pending.begin(), std::make_move_iterator(remaining.begin()),
                    std::make_move_iterator(remaining.end()));
                throw;
            }

            ++count;
        }

        running = nullptr;
        return count;
    }

    int FrameScheduler::DispatchFrame(double timestamp)
    {
        if (pending.empty()) return 0;

        std::vector<Entry> batch;
        batch.swap(pending);
        return Run(batch, timestamp);
    }

    int FrameScheduler::Poll(double now)
    {
        std::vector<Entry> batch;
        auto split = std::stable_partition(pending.begin(), pending.end(),
            [now](const Entry& entry) { return entry.due <= now; });

        std::move(pending.begin(), split, std::back_inserter(batch));
        pending.erase(pending.begin(), split);
        return batch.empty() ? 0 : Run(batch, std::nullopt);
    }

    int FrameScheduler::Poll()
    {
        return Poll(Now());
    }

    int FrameScheduler::Pending() const
    {
        return (int)pending.size();
    }
}
