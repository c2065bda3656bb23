//=============================================================================
// EventBus Tests
//=============================================================================

#include <boost/ut.hpp>
#include <inkwell/base/event-bus.h>

#include <memory>
#include <string>
#include <vector>

using namespace boost::ut;
using namespace inkwell;
using namespace inkwell::base;

namespace {

class RecordingListener : public EventListener {
public:
    RecordingListener(std::string name, std::vector<std::string>* log, bool consume = false)
        : _name(std::move(name)), _log(log), _consume(consume) {}

    Result<bool> onEvent(const Event& event) override {
        _log->push_back(_name);
        lastWidth = event.nativeSize.width;
        lastHeight = event.nativeSize.height;
        if (fail) {
            return Err<bool>(_name + " failed");
        }
        return Ok(_consume);
    }

    int shutdownCalls = 0;
    uint32_t lastWidth = 0;
    uint32_t lastHeight = 0;
    bool fail = false;

protected:
    Result<void> onShutdown() override {
        shutdownCalls++;
        return Ok();
    }

private:
    std::string _name;
    std::vector<std::string>* _log;
    bool _consume;
};

constexpr auto NativeSize = Event::Type::NativeSizeChanged;

} // namespace

suite event_bus_tests = [] {
    "dispatch runs in priority order"_test = [] {
        std::vector<std::string> log;
        EventBus bus;
        auto low = std::make_shared<RecordingListener>("low", &log);
        auto high = std::make_shared<RecordingListener>("high", &log);
        auto mid = std::make_shared<RecordingListener>("mid", &log);

        expect(bus.registerListener(NativeSize, low, -5).has_value());
        expect(bus.registerListener(NativeSize, high, 10).has_value());
        expect(bus.registerListener(NativeSize, mid).has_value());

        auto res = bus.dispatch(Event::nativeSizeChanged(640, 480));
        expect(res.has_value() >> fatal);
        expect(!*res);
        expect((log == std::vector<std::string>{"high", "mid", "low"}) >> fatal);
        expect(low->lastWidth == 640_u);
        expect(low->lastHeight == 480_u);
    };

    "dispatch stops at the first consumer"_test = [] {
        std::vector<std::string> log;
        EventBus bus;
        auto first = std::make_shared<RecordingListener>("first", &log, true);
        auto second = std::make_shared<RecordingListener>("second", &log);
        expect(bus.registerListener(NativeSize, first, 1).has_value());
        expect(bus.registerListener(NativeSize, second, 0).has_value());

        auto res = bus.dispatch(Event::nativeSizeChanged(1, 1));
        expect(res.has_value() >> fatal);
        expect(*res);
        expect(log.size() == 1_u);
    };

    "broadcast reaches every listener"_test = [] {
        std::vector<std::string> log;
        EventBus bus;
        auto a = std::make_shared<RecordingListener>("a", &log, true);
        auto b = std::make_shared<RecordingListener>("b", &log, true);
        expect(bus.registerListener(NativeSize, a).has_value());
        expect(bus.registerListener(NativeSize, b).has_value());

        expect(bus.broadcast(Event::nativeSizeChanged(2, 2)).has_value());
        expect(log.size() == 2_u);
    };

    "handler failure propagates"_test = [] {
        std::vector<std::string> log;
        EventBus bus;
        auto broken = std::make_shared<RecordingListener>("broken", &log);
        broken->fail = true;
        expect(bus.registerListener(NativeSize, broken).has_value());

        expect(!bus.dispatch(Event::nativeSizeChanged(1, 1)).has_value());
        expect(!bus.broadcast(Event::nativeSizeChanged(1, 1)).has_value());
    };

    "broadcast notifies everyone past a failing listener"_test = [] {
        std::vector<std::string> log;
        EventBus bus;
        auto broken = std::make_shared<RecordingListener>("broken", &log);
        broken->fail = true;
        auto later = std::make_shared<RecordingListener>("later", &log);
        expect(bus.registerListener(NativeSize, broken, 1).has_value());
        expect(bus.registerListener(NativeSize, later, 0).has_value());

        auto res = bus.broadcast(Event::nativeSizeChanged(3, 4));
        expect(!res.has_value());
        expect((log == std::vector<std::string>{"broken", "later"}));
        expect(later->lastWidth == 3_u);
        expect(later->lastHeight == 4_u);
    };

    "null listener is rejected"_test = [] {
        EventBus bus;
        expect(!bus.registerListener(NativeSize, nullptr).has_value());
    };

    "expired listeners are skipped"_test = [] {
        std::vector<std::string> log;
        EventBus bus;
        auto kept = std::make_shared<RecordingListener>("kept", &log);
        {
            auto gone = std::make_shared<RecordingListener>("gone", &log);
            expect(bus.registerListener(NativeSize, gone).has_value());
        }
        expect(bus.registerListener(NativeSize, kept).has_value());
        expect(bus.listenerCount(NativeSize) == 1_u);

        expect(bus.broadcast(Event::nativeSizeChanged(1, 1)).has_value());
        expect((log == std::vector<std::string>{"kept"}));
    };

    "deregistered listeners no longer receive events"_test = [] {
        std::vector<std::string> log;
        EventBus bus;
        auto a = std::make_shared<RecordingListener>("a", &log);
        auto b = std::make_shared<RecordingListener>("b", &log);
        expect(bus.registerListener(NativeSize, a).has_value());
        expect(bus.registerListener(NativeSize, b).has_value());

        expect(bus.deregisterListener(NativeSize, a).has_value());
        expect(bus.listenerCount(NativeSize) == 1_u);

        expect(bus.deregisterListener(b).has_value());
        expect(bus.listenerCount(NativeSize) == 0_u);

        expect(bus.broadcast(Event::nativeSizeChanged(1, 1)).has_value());
        expect(log.empty());
    };

    "shutdown runs once"_test = [] {
        std::vector<std::string> log;
        auto listener = std::make_shared<RecordingListener>("x", &log);
        expect(!listener->isShutdown());
        expect(listener->shutdown().has_value());
        expect(listener->shutdown().has_value());
        expect(listener->isShutdown());
        expect(listener->shutdownCalls == 1_i);
    };

    "object ids are unique"_test = [] {
        std::vector<std::string> log;
        auto a = std::make_shared<RecordingListener>("a", &log);
        auto b = std::make_shared<RecordingListener>("b", &log);
        expect(a->id() != b->id());
        expect(a->sharedAs<EventListener>() == a);
    };
};
