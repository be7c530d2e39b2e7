#include "execution/OrderOrchestrator.hpp"
#include "broker/BrokerResponse.hpp"
#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include <algorithm>
#include <future>
#include <memory>
#include <thread>

namespace optgate {

    OrderOrchestrator::OrderOrchestrator(Submitter submitter, std::chrono::milliseconds join_timeout)
        : submitter_(std::move(submitter)), join_timeout_(join_timeout) {}

    void OrderOrchestrator::validate(const OrderLeg& leg) {
        if (leg.stock_code.empty()) throw InvalidLeg("leg missing stock_code");
        if (!leg.quantity || *leg.quantity <= 0) throw InvalidLeg("leg missing quantity");
        if (leg.expiry_date.empty()) throw InvalidLeg("leg missing expiry_date");
        if (!leg.strike_price) throw InvalidLeg("leg missing strike_price");
    }

    OrderLeg OrderOrchestrator::square_off_leg(const OrderLeg& leg) {
        OrderLeg exit = leg;
        exit.action = leg.action == Action::Buy ? Action::Sell : Action::Buy;
        exit.user_remark = "SquareOff_optgate";
        return exit;
    }

    LegResult OrderOrchestrator::submit_one(const Submitter& submitter, const OrderLeg& leg, size_t index) {
        LegResult result;
        result.leg_index = index;
        try {
            validate(leg);
            BrokerResponse response = parse_broker_response(submitter(leg));
            result.success = response.ok;
            if (response.ok) {
                result.order_id = response.order_id;
            } else {
                result.error = response.error;
            }
        } catch (const std::exception& e) {
            result.success = false;
            result.error = e.what();
        }
        return result;
    }

    std::vector<LegResult> OrderOrchestrator::orchestrate(const std::vector<OrderLeg>& legs) const {
        std::vector<LegResult> results;
        if (legs.empty()) return results;

        // Shared so a unit that outlives its join timeout still has a valid submitter.
        auto submitter = std::make_shared<Submitter>(submitter_);

        std::vector<std::future<LegResult>> pending;
        pending.reserve(legs.size());
        for (size_t i = 0; i < legs.size(); ++i) {
            auto promise = std::make_shared<std::promise<LegResult>>();
            pending.push_back(promise->get_future());
            std::thread([promise, submitter, leg = legs[i], i]() {
                promise->set_value(submit_one(*submitter, leg, i));
            }).detach();
        }

        results.reserve(legs.size());
        for (size_t i = 0; i < pending.size(); ++i) {
            if (pending[i].wait_for(join_timeout_) == std::future_status::ready) {
                results.push_back(pending[i].get());
            } else {
                LOG_WARN("[Orders] leg %zu did not finish within %lldms", i,
                         static_cast<long long>(join_timeout_.count()));
                LegResult late;
                late.leg_index = i;
                late.error = "timed out waiting for order leg";
                results.push_back(late);
            }
        }

        std::sort(results.begin(), results.end(),
                  [](const LegResult& a, const LegResult& b) { return a.leg_index < b.leg_index; });

        size_t ok = std::count_if(results.begin(), results.end(), [](const LegResult& r) { return r.success; });
        LOG_INFO("[Orders] strategy of %zu legs: %zu placed", results.size(), ok);
        return results;
    }

}
