#include "jobwatch/ItemReconciler.hpp"

#include <algorithm>

namespace jobwatch {

namespace {

int clampProgress(int p) { return std::max(0, std::min(100, p)); }

} // namespace

Item *findItemByIndex(std::vector<Item> &items, int index) {
    auto it = std::find_if(items.begin(), items.end(),
                           [index](const Item &i) { return i.index == index; });
    return it == items.end() ? nullptr : &*it;
}

bool reconcileItems(std::vector<Item> &items,
                    const std::map<int, ItemSnapshot> &snapshot) {
    bool changed = false;
    for (const auto &kv : snapshot) {
        Item *item = findItemByIndex(items, kv.first);
        if (!item || item->terminalReached)
            continue;
        const ItemSnapshot &in = kv.second;

        ItemStatus status = in.status;
        int progress = item->progress;
        std::string stage = in.stage ? *in.stage : item->stage;
        bool terminal = false;

        switch (in.status) {
        case ItemStatus::Completed:
            progress = 100;
            terminal = true;
            break;
        case ItemStatus::Error:
            if (in.progress)
                progress = clampProgress(*in.progress);
            terminal = true;
            break;
        default:
            if (in.progress)
                progress = clampProgress(*in.progress);
            break;
        }

        if (item->status != status || item->progress != progress ||
            item->stage != stage || item->terminalReached != terminal) {
            item->status = status;
            item->progress = progress;
            item->stage = std::move(stage);
            item->terminalReached = terminal;
            changed = true;
        }
    }
    return changed;
}

} // namespace jobwatch
