/// @file ingress_detector.cpp
/// @brief Ingress detection between adjacent samples.

#include "events/ingress_detector.hpp"

namespace gochara::events
{

std::vector<IngressEvent> IngressDetector::detect(const ephemeris::Snapshot& current,
                                                  const ephemeris::Snapshot* previous)
{
    std::vector<IngressEvent> ingresses;
    if (previous == nullptr)
    {
        return ingresses;
    }

    for (const ephemeris::PlanetPosition& now : current.positions())
    {
        const ephemeris::PlanetPosition* before = previous->find(now.planet);
        if (before == nullptr || before->zodiac.sign_index == now.zodiac.sign_index)
        {
            continue;
        }

        ingresses.push_back(IngressEvent{
            .planet          = now.planet,
            .from_sign_index = before->zodiac.sign_index,
            .to_sign_index   = now.zodiac.sign_index,
            .degree          = now.zodiac.degree_formatted,
            .longitude       = now.longitude(),
            .datetime        = {},
        });
    }

    return ingresses;
}

} // namespace gochara::events
