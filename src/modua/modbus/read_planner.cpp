#include "read_planner.h"

#include <QMap>
#include <QPair>
#include <algorithm>

namespace modua::modbus {

QVector<ReadBatch> planReads(const QVector<TagDefinition>& tags,
                             const QVector<int>& dueIndices,
                             const BlockSizes& blockSizes)
{
    // (unitId, 地址区) -> 标签下标
    QMap<QPair<int, int>, QVector<int>> buckets;
    for (int idx : dueIndices) {
        if (idx < 0 || idx >= tags.size()) continue;
        const TagDefinition& tag = tags[idx];
        buckets[qMakePair(tag.unitId, static_cast<int>(tag.address.type))].append(idx);
    }

    QVector<ReadBatch> batches;
    for (auto it = buckets.begin(); it != buckets.end(); ++it) {
        QVector<int> indices = it.value();
        std::stable_sort(indices.begin(), indices.end(), [&tags](int a, int b) {
            return tags[a].wire < tags[b].wire;
        });

        const auto type = static_cast<AddressType>(it.key().second);
        const int limit = blockSizes.limitFor(type);

        ReadBatch current;
        bool open = false;
        for (int idx : indices) {
            const TagDefinition& tag = tags[idx];
            if (open) {
                const int newEnd = std::max(current.start + current.count - 1, tag.end());
                if (newEnd - current.start + 1 <= limit) {
                    current.count = newEnd - current.start + 1;
                    current.tagIndices.append(idx);
                    continue;
                }
                batches.append(current);
            }
            current = ReadBatch();
            current.unitId = it.key().first;
            current.type = type;
            current.function = readFunctionFor(type);
            current.start = tag.wire;
            current.count = tag.span();
            current.tagIndices = {idx};
            open = true;
        }
        if (open) batches.append(current);
    }
    return batches;
}

} // namespace modua::modbus
