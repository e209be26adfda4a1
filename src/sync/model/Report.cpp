#include "sync/model/Report.hpp"

using namespace mcs::sync::model;

void Report::record(Outcome outcome) {
    if (outcome.cancelled) cancelled = true;
    else if (outcome.failed()) ++failed;
    else if (outcome.action == Action::Download) ++downloaded;
    else if (outcome.action == Action::Upload) ++uploaded;
    else ++skipped;
    outcomes.push_back(std::move(outcome));
}
