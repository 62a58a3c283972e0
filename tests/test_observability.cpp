#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"

#include "docgate/observability/factory.hpp"
#include "docgate/observability/global.hpp"
#include "docgate/observability/log_observer.hpp"
#include "docgate/observability/multi_observer.hpp"
#include "docgate/observability/noop_observer.hpp"

namespace {

class CountingObserver final : public docgate::observability::IObserver {
public:
  explicit CountingObserver(std::size_t &events, std::size_t &metrics)
      : events_(events), metrics_(metrics) {}

  void record_event(const docgate::observability::ObserverEvent &) override { ++events_; }
  void record_metric(const docgate::observability::ObserverMetric &) override { ++metrics_; }
  [[nodiscard]] std::string_view name() const override { return "counting"; }

private:
  std::size_t &events_;
  std::size_t &metrics_;
};

} // namespace

void register_observability_tests(std::vector<docgate::tests::TestCase> &tests) {
  using docgate::tests::require;
  namespace obs = docgate::observability;

  tests.push_back({"observer_factory_backends", [] {
                     auto config = docgate::testing::mock_config();
                     config.observability.backend = "none";
                     require(obs::create_observer(config)->name() == "noop", "none -> noop");

                     config.observability.backend = "LOG";
                     require(obs::create_observer(config)->name() == "log", "log backend");

                     config.observability.backend = "log,noop";
                     auto combined = obs::create_observer(config);
                     require(combined->name() == "multi", "comma list -> multi");
                     auto *multi = dynamic_cast<obs::MultiObserver *>(combined.get());
                     require(multi != nullptr && multi->size() == 2, "two children expected");
                   }});

  tests.push_back({"multi_observer_fans_out", [] {
                     std::size_t events_a = 0;
                     std::size_t metrics_a = 0;
                     std::size_t events_b = 0;
                     std::size_t metrics_b = 0;
                     obs::MultiObserver multi;
                     multi.add(std::make_unique<CountingObserver>(events_a, metrics_a));
                     multi.add(std::make_unique<CountingObserver>(events_b, metrics_b));

                     multi.record_event(obs::SweepEvent{.removed = 2});
                     multi.record_metric(obs::TokensDeliveredMetric{.tokens = 10});
                     multi.flush();
                     require(events_a == 1 && events_b == 1, "each child sees the event");
                     require(metrics_a == 1 && metrics_b == 1, "each child sees the metric");
                   }});

  tests.push_back({"global_recorders_route_to_observer", [] {
                     docgate::testing::ObserverCapture capture;
                     obs::record_continuation_created("tok", 1, 3000);
                     obs::record_chunk_delivered(1, 2000, true);
                     obs::record_continuation_miss(obs::MissReason::Expired);
                     obs::record_sweep(4);
                     obs::record_error("chunking", "boom");

                     auto &recorder = capture.observer();
                     require(recorder.events().size() == 5, "five events expected");
                     require(recorder.count_events<obs::ChunkDeliveredEvent>() == 1,
                             "one delivery");
                     require(recorder.metrics().size() == 1, "delivery also records tokens");

                     const auto events = recorder.events();
                     const auto &miss = std::get<obs::ContinuationMissEvent>(events[2]);
                     require(miss.reason == obs::MissReason::Expired, "miss reason mismatch");
                     const auto &error = std::get<obs::ErrorEvent>(events[4]);
                     require(error.component == "chunking" && error.message == "boom",
                             "error event mismatch");
                   }});

  tests.push_back({"replaced_observer_outlives_holders", [] {
                     std::size_t events = 0;
                     std::size_t metrics = 0;
                     obs::set_global_observer(std::make_unique<CountingObserver>(events, metrics));
                     const auto held = obs::get_global_observer();
                     obs::set_global_observer(std::make_unique<obs::NoopObserver>());
                     held->record_event(obs::SweepEvent{.removed = 1});
                     require(events == 1, "a held observer stays usable after replacement");

                     require(!obs::set_global_observer_if_absent(std::make_unique<obs::NoopObserver>()),
                             "an installed observer is kept");
                     obs::set_global_observer(nullptr);
                     require(obs::set_global_observer_if_absent(std::make_unique<obs::NoopObserver>()),
                             "an empty slot is filled");
                     require(obs::get_global_observer()->name() == "noop", "noop installed");
                   }});

  tests.push_back({"record_without_observer_is_safe", [] {
                     obs::set_global_observer(nullptr);
                     obs::record_sweep(1);
                     obs::record_metric(obs::ActiveContinuationsMetric{.count = 1});
                     require(obs::get_global_observer() == nullptr, "observer should stay unset");
                     obs::set_global_observer(std::make_unique<obs::NoopObserver>());
                   }});

  tests.push_back({"miss_reason_names", [] {
                     require(obs::miss_reason_to_string(obs::MissReason::NotFound) == "not_found",
                             "not_found");
                     require(obs::miss_reason_to_string(obs::MissReason::Expired) == "expired",
                             "expired");
                     require(obs::miss_reason_to_string(obs::MissReason::StorageError) ==
                                 "storage_error",
                             "storage_error");
                     require(obs::miss_reason_to_string(obs::MissReason::Consumed) == "consumed",
                             "consumed");
                   }});

  tests.push_back({"log_observer_accepts_every_event", [] {
                     obs::LogObserver log;
                     log.record_event(obs::ContinuationCreatedEvent{
                         .token = "t", .chunk_number = 1, .remaining_tokens = 5});
                     log.record_event(obs::ErrorEvent{.component = "test", .message = "ignore me"});
                     log.record_metric(obs::SectionsSelectedMetric{
                         .selected = 2, .total = 3, .bytes = 90});
                     log.flush();
                     require(log.name() == "log", "log observer name");
                   }});
}
