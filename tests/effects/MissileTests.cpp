/* Copyright (c) 2025 Stormfire Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE MissileTests
#include <boost/test/unit_test.hpp>

#include <cmath>
#include <limits>
#include <vector>

#include "core/Logger.hpp"
#include "effects/Missile.hpp"
#include "mocks/MockWeaponAudio.hpp"

using namespace Stormfire;

struct QuietLogFixture {
    QuietLogFixture() { STORMFIRE_ENABLE_QUIET_MODE(); }
};

BOOST_GLOBAL_FIXTURE(QuietLogFixture);

namespace {
const std::vector<EnemyView> NO_ENEMIES;
}

// ============================================================================
// CONSTRUCTION
// ============================================================================

BOOST_AUTO_TEST_SUITE(MissileConstructionTests)

BOOST_AUTO_TEST_CASE(TestStandardMissileDefaults) {
    Missile missile(MissileKind::Standard, Vector2D(0.0f, 0.0f), Vector2D(100.0f, 0.0f));

    BOOST_CHECK(missile.getState() == MissileState::Flying);
    BOOST_CHECK_CLOSE(missile.getVelocity().getX(), 800.0f, 0.001f);
    BOOST_CHECK_SMALL(missile.getVelocity().getY(), 0.001f);
    BOOST_CHECK_SMALL(missile.getAngle(), 0.001f);
    BOOST_CHECK_EQUAL(missile.getLength(), 60.0f);
    BOOST_CHECK_EQUAL(missile.getWidth(), 18.0f);
    BOOST_CHECK_EQUAL(missile.getMaxTrailLength(), 8u);
    BOOST_CHECK_EQUAL(missile.getDamage(), Missile::DEFAULT_DAMAGE);
    BOOST_CHECK_EQUAL(missile.getExplosionRadius(), Missile::DEFAULT_EXPLOSION_RADIUS);
    BOOST_CHECK(missile.getTrail().empty());
}

BOOST_AUTO_TEST_CASE(TestSpecialAttackIsLarger) {
    Missile missile(MissileKind::SpecialAttack, Vector2D(0.0f, 0.0f), Vector2D(0.0f, 100.0f));

    BOOST_CHECK(missile.isSpecialAttack());
    BOOST_CHECK_EQUAL(missile.getLength(), 80.0f);
    BOOST_CHECK_EQUAL(missile.getWidth(), 24.0f);
    BOOST_CHECK_EQUAL(missile.getMaxTrailLength(), 10u);
    BOOST_CHECK_CLOSE(missile.getFlameIntensityBase(), 1.2f, 0.001f);
    BOOST_CHECK_CLOSE(missile.getFlameIntensityVariance(), 0.4f, 0.001f);
    // Pointing straight down
    BOOST_CHECK_CLOSE(missile.getAngle(), std::acos(0.0f), 0.01f);
}

BOOST_AUTO_TEST_CASE(TestZeroLengthFlightHasNoVelocity) {
    Missile missile(MissileKind::Standard, Vector2D(50.0f, 50.0f), Vector2D(50.0f, 50.0f));

    BOOST_CHECK_EQUAL(missile.getVelocity().getX(), 0.0f);
    BOOST_CHECK_EQUAL(missile.getVelocity().getY(), 0.0f);
    BOOST_CHECK(std::isfinite(missile.getAngle()));

    // Already at its target, so the first tick detonates it
    missile.update(0.016f, NO_ENEMIES, nullptr);
    BOOST_CHECK(missile.isExploding());
    BOOST_CHECK(std::isfinite(missile.getPosition().getX()));
}

BOOST_AUTO_TEST_CASE(TestBodyRectIsCentered) {
    Missile missile(MissileKind::Standard, Vector2D(200.0f, 100.0f), Vector2D(400.0f, 100.0f));
    SDL_FRect rect = missile.getRect();

    BOOST_CHECK_CLOSE(rect.x, 170.0f, 0.001f);
    BOOST_CHECK_CLOSE(rect.y, 91.0f, 0.001f);
    BOOST_CHECK_EQUAL(rect.w, 60.0f);
    BOOST_CHECK_EQUAL(rect.h, 18.0f);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// FLIGHT AND STATE MACHINE
// ============================================================================

BOOST_AUTO_TEST_SUITE(MissileFlightTests)

BOOST_AUTO_TEST_CASE(TestFliesThenArrivesThenFinishes) {
    Missile missile(MissileKind::Standard, Vector2D(0.0f, 0.0f), Vector2D(100.0f, 0.0f));

    BOOST_CHECK(!missile.update(0.1f, NO_ENEMIES, nullptr));
    BOOST_CHECK(missile.getState() == MissileState::Flying);
    BOOST_CHECK_CLOSE(missile.getPosition().getX(), 80.0f, 0.001f);

    BOOST_CHECK(!missile.update(0.02f, NO_ENEMIES, nullptr));
    BOOST_CHECK(missile.getState() == MissileState::Exploding);
    BOOST_CHECK_CLOSE(missile.getPosition().getX(), 96.0f, 0.001f);
    BOOST_CHECK_EQUAL(missile.getExplosionAge(), 0.0f);

    BOOST_CHECK(!missile.update(0.3f, NO_ENEMIES, nullptr));
    BOOST_CHECK(missile.isExploding());

    BOOST_CHECK(missile.update(0.3f, NO_ENEMIES, nullptr));
    BOOST_CHECK(missile.isFinished());
}

BOOST_AUTO_TEST_CASE(TestStatesOnlyMoveForward) {
    Missile missile(MissileKind::Standard, Vector2D(0.0f, 0.0f), Vector2D(300.0f, 0.0f));

    int previous = static_cast<int>(missile.getState());
    for (int i = 0; i < 200 && !missile.isFinished(); ++i) {
        missile.update(0.016f, NO_ENEMIES, nullptr);
        int current = static_cast<int>(missile.getState());
        BOOST_CHECK_GE(current, previous);
        previous = current;
    }
    BOOST_CHECK(missile.isFinished());

    // Finished missiles stay put
    Vector2D position = missile.getPosition();
    missile.update(1.0f, NO_ENEMIES, nullptr);
    BOOST_CHECK(missile.isFinished());
    BOOST_CHECK_EQUAL(missile.getPosition().getX(), position.getX());
}

BOOST_AUTO_TEST_CASE(TestMaxFlightTimeDetonates) {
    Missile missile(MissileKind::Standard, Vector2D(0.0f, 0.0f), Vector2D(100000.0f, 0.0f));
    missile.setMaxFlightTime(0.05f);

    missile.update(0.03f, NO_ENEMIES, nullptr);
    BOOST_CHECK(missile.getState() == MissileState::Flying);
    missile.update(0.03f, NO_ENEMIES, nullptr);
    BOOST_CHECK(missile.isExploding());
}

BOOST_AUTO_TEST_CASE(TestProximityToEnemyDetonates) {
    Missile missile(MissileKind::Standard, Vector2D(0.0f, 0.0f), Vector2D(1000.0f, 0.0f));
    std::vector<EnemyView> enemies{makeEnemy(215.0f, 10.0f)};

    missile.update(0.1f, enemies, nullptr);
    BOOST_CHECK(missile.getState() == MissileState::Flying);

    missile.update(0.15f, enemies, nullptr);
    BOOST_CHECK(missile.isExploding());
}

BOOST_AUTO_TEST_CASE(TestInvalidDeltaTimeIsIgnored) {
    Missile missile(MissileKind::Standard, Vector2D(0.0f, 0.0f), Vector2D(1000.0f, 0.0f));

    missile.update(std::numeric_limits<float>::quiet_NaN(), NO_ENEMIES, nullptr);
    missile.update(-1.0f, NO_ENEMIES, nullptr);

    BOOST_CHECK_EQUAL(missile.getAge(), 0.0f);
    BOOST_CHECK_EQUAL(missile.getPosition().getX(), 0.0f);
    BOOST_CHECK(missile.getState() == MissileState::Flying);
}

BOOST_AUTO_TEST_CASE(TestZeroDeltaTimeStillChecksArrival) {
    Missile missile(MissileKind::Standard, Vector2D(0.0f, 0.0f), Vector2D(5.0f, 0.0f));
    missile.update(0.0f, NO_ENEMIES, nullptr);
    BOOST_CHECK(missile.isExploding());
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// TRAIL
// ============================================================================

BOOST_AUTO_TEST_SUITE(MissileTrailTests)

BOOST_AUTO_TEST_CASE(TestTrailIsCappedAndOrdered) {
    Missile missile(MissileKind::Standard, Vector2D(0.0f, 0.0f), Vector2D(10000.0f, 0.0f));

    Vector2D lastPosition = missile.getPosition();
    for (int i = 0; i < 20; ++i) {
        lastPosition = missile.getPosition();
        missile.update(0.01f, NO_ENEMIES, nullptr);
    }

    auto trail = missile.getTrail();
    BOOST_REQUIRE_EQUAL(trail.size(), 8u);
    // Newest entry is the position before the last step
    BOOST_CHECK_CLOSE(trail.back().getX(), lastPosition.getX(), 0.001f);
    for (size_t i = 1; i < trail.size(); ++i) {
        BOOST_CHECK_LT(trail[i - 1].getX(), trail[i].getX());
    }
}

BOOST_AUTO_TEST_CASE(TestSpecialTrailHoldsTen) {
    Missile missile(MissileKind::SpecialAttack, Vector2D(0.0f, 0.0f), Vector2D(10000.0f, 0.0f));
    for (int i = 0; i < 30; ++i) {
        missile.update(0.01f, NO_ENEMIES, nullptr);
    }
    BOOST_CHECK_EQUAL(missile.getTrail().size(), 10u);
}

BOOST_AUTO_TEST_CASE(TestGrenadeLeavesNoTrail) {
    Missile grenade(MissileKind::Grenade, Vector2D(0.0f, 0.0f), Vector2D(10000.0f, 0.0f),
                    45.0f, 150.0f, 600.0f);
    for (int i = 0; i < 10; ++i) {
        grenade.update(0.01f, NO_ENEMIES, nullptr);
    }
    BOOST_CHECK(grenade.isGrenade());
    BOOST_CHECK(grenade.getTrail().empty());
    BOOST_CHECK_CLOSE(grenade.getPosition().getX(), 60.0f, 0.01f);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// DAMAGE
// ============================================================================

BOOST_AUTO_TEST_SUITE(MissileDamageTests)

BOOST_AUTO_TEST_CASE(TestBodyHitDealsQuarterDamageOnce) {
    Missile missile(MissileKind::Standard, Vector2D(0.0f, 0.0f), Vector2D(1000.0f, 0.0f));
    // Body reach 30 plus half the enemy size
    std::vector<EnemyView> enemies{makeEnemy(35.0f, 0.0f, 20.0f), makeEnemy(45.0f, 0.0f, 20.0f)};

    DamageEvents first = missile.checkVisualDamage(enemies);
    BOOST_REQUIRE_EQUAL(first.size(), 1u);
    BOOST_CHECK(first[0].target == enemies[0].handle);
    BOOST_CHECK_CLOSE(first[0].damage, 30.0f, 0.001f);
    BOOST_CHECK_EQUAL(first[0].cause, DamageCause::MissileBody);

    DamageEvents second = missile.checkVisualDamage(enemies);
    BOOST_CHECK(second.empty());
}

BOOST_AUTO_TEST_CASE(TestExplosionRadiusGrowsThenHolds) {
    Missile missile(MissileKind::Standard, Vector2D(0.0f, 0.0f), Vector2D(5.0f, 0.0f));
    BOOST_CHECK_EQUAL(missile.getCurrentExplosionRadius(), 0.0f);

    missile.update(0.001f, NO_ENEMIES, nullptr);
    BOOST_REQUIRE(missile.isExploding());
    BOOST_CHECK_EQUAL(missile.getCurrentExplosionRadius(), 0.0f);

    missile.update(0.21f, NO_ENEMIES, nullptr);
    BOOST_CHECK_CLOSE(missile.getExplosionProgress(), 0.35f, 0.01f);
    BOOST_CHECK_CLOSE(missile.getCurrentExplosionRadius(), 75.0f, 0.01f);

    missile.update(0.3f, NO_ENEMIES, nullptr);
    BOOST_CHECK_EQUAL(missile.getCurrentExplosionRadius(), 150.0f);
}

BOOST_AUTO_TEST_CASE(TestExplosionReachesEnemiesAsItGrows) {
    Missile missile(MissileKind::Standard, Vector2D(0.0f, 0.0f), Vector2D(5.0f, 0.0f));
    missile.update(0.001f, NO_ENEMIES, nullptr);
    BOOST_REQUIRE(missile.isExploding());

    const Vector2D center = missile.getPosition();
    std::vector<EnemyView> enemies{makeEnemy(center.getX() + 70.0f, center.getY(), 0.0f),
                                   makeEnemy(center.getX() + 100.0f, center.getY(), 0.0f)};

    missile.update(0.21f, NO_ENEMIES, nullptr);
    DamageEvents early = missile.checkVisualDamage(enemies);
    BOOST_REQUIRE_EQUAL(early.size(), 1u);
    BOOST_CHECK(early[0].target == enemies[0].handle);
    BOOST_CHECK_EQUAL(early[0].damage, 120.0f);
    BOOST_CHECK_EQUAL(early[0].cause, DamageCause::Explosion);

    missile.update(0.3f, NO_ENEMIES, nullptr);
    DamageEvents late = missile.checkVisualDamage(enemies);
    BOOST_REQUIRE_EQUAL(late.size(), 1u);
    BOOST_CHECK(late[0].target == enemies[1].handle);
}

BOOST_AUTO_TEST_CASE(TestBodyHitVictimIsNotHitAgainByExplosion) {
    Missile missile(MissileKind::Standard, Vector2D(0.0f, 0.0f), Vector2D(1000.0f, 0.0f));
    std::vector<EnemyView> enemies{makeEnemy(100.0f, 0.0f, 20.0f)};

    missile.update(0.1f, NO_ENEMIES, nullptr);
    BOOST_CHECK_EQUAL(missile.checkVisualDamage(enemies).size(), 1u);

    missile.update(0.01f, enemies, nullptr);
    BOOST_REQUIRE(missile.isExploding());
    missile.update(0.5f, enemies, nullptr);
    BOOST_CHECK(missile.checkVisualDamage(enemies).empty());
}

BOOST_AUTO_TEST_CASE(TestFinishedMissileDealsNoDamage) {
    Missile missile(MissileKind::Standard, Vector2D(0.0f, 0.0f), Vector2D(0.0f, 0.0f));
    missile.update(0.01f, NO_ENEMIES, nullptr);
    missile.update(1.0f, NO_ENEMIES, nullptr);
    BOOST_REQUIRE(missile.isFinished());

    std::vector<EnemyView> enemies{makeEnemy(0.0f, 0.0f, 40.0f)};
    BOOST_CHECK(missile.checkVisualDamage(enemies).empty());
    BOOST_CHECK(!missile.getExplosionDamageArea().has_value());
}

BOOST_AUTO_TEST_CASE(TestExplosionDamageAreaOnlyWhileExploding) {
    Missile missile(MissileKind::Standard, Vector2D(0.0f, 0.0f), Vector2D(5.0f, 0.0f));
    BOOST_CHECK(!missile.getExplosionDamageArea().has_value());

    missile.update(0.001f, NO_ENEMIES, nullptr);
    auto area = missile.getExplosionDamageArea();
    BOOST_REQUIRE(area.has_value());
    BOOST_CHECK_EQUAL(area->radius, 150.0f);
    BOOST_CHECK_EQUAL(area->center.getX(), missile.getPosition().getX());
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// DETONATION SIDE EFFECTS
// ============================================================================

BOOST_AUTO_TEST_SUITE(MissileDetonationTests)

BOOST_AUTO_TEST_CASE(TestDetonationStopsFlightSoundAndPlaysExplosion) {
    MockWeaponAudio audio;
    Missile missile(MissileKind::Standard, Vector2D(0.0f, 0.0f), Vector2D(5.0f, 0.0f));
    missile.setFlightSound(audio.startMissileFlight());
    SoundHandle handle = missile.getFlightSound();

    missile.update(0.001f, NO_ENEMIES, &audio);

    BOOST_CHECK(audio.wasStopped(handle));
    BOOST_CHECK_EQUAL(audio.explosions, 1);
    BOOST_CHECK_EQUAL(missile.getFlightSound(), INVALID_SOUND_HANDLE);

    // Nothing further once exploding
    missile.update(1.0f, NO_ENEMIES, &audio);
    BOOST_CHECK_EQUAL(audio.explosions, 1);
    BOOST_CHECK_EQUAL(audio.stopped.size(), 1u);
}

BOOST_AUTO_TEST_CASE(TestDetonationWithoutAudio) {
    Missile missile(MissileKind::Standard, Vector2D(0.0f, 0.0f), Vector2D(5.0f, 0.0f));
    missile.setFlightSound(42);
    missile.update(0.001f, NO_ENEMIES, nullptr);
    BOOST_CHECK(missile.isExploding());
    BOOST_CHECK_EQUAL(missile.getFlightSound(), INVALID_SOUND_HANDLE);
}

BOOST_AUTO_TEST_CASE(TestReleaseFlightSoundHandsOverHandle) {
    Missile missile(MissileKind::Standard, Vector2D(0.0f, 0.0f), Vector2D(500.0f, 0.0f));
    missile.setFlightSound(7);
    BOOST_CHECK_EQUAL(missile.releaseFlightSound(), 7u);
    BOOST_CHECK_EQUAL(missile.getFlightSound(), INVALID_SOUND_HANDLE);
}

BOOST_AUTO_TEST_CASE(TestSpecialAttackSpawnsGroundFireOnce) {
    struct Spawned {
        Vector2D center;
        float radius;
        float dps;
        float duration;
    };
    std::vector<Spawned> spawned;

    Missile missile(MissileKind::SpecialAttack, Vector2D(0.0f, 0.0f), Vector2D(5.0f, 0.0f));
    missile.setGroundFireCallback(
        [&spawned](const Vector2D& center, float radius, float dps, float duration) {
            spawned.push_back({center, radius, dps, duration});
        });

    missile.update(0.001f, NO_ENEMIES, nullptr);
    missile.update(0.3f, NO_ENEMIES, nullptr);
    missile.update(0.3f, NO_ENEMIES, nullptr);

    BOOST_REQUIRE_EQUAL(spawned.size(), 1u);
    BOOST_CHECK_CLOSE(spawned[0].radius, 120.0f, 0.001f);
    BOOST_CHECK_EQUAL(spawned[0].dps, 15.0f);
    BOOST_CHECK_EQUAL(spawned[0].duration, 5.0f);
    BOOST_CHECK_EQUAL(spawned[0].center.getX(), missile.getPosition().getX());
}

BOOST_AUTO_TEST_CASE(TestStandardMissileIgnoresGroundFireCallback) {
    int calls = 0;
    Missile missile(MissileKind::Standard, Vector2D(0.0f, 0.0f), Vector2D(5.0f, 0.0f));
    missile.setGroundFireCallback([&calls](const Vector2D&, float, float, float) { ++calls; });
    missile.update(0.001f, NO_ENEMIES, nullptr);
    BOOST_CHECK(missile.isExploding());
    BOOST_CHECK_EQUAL(calls, 0);
}

BOOST_AUTO_TEST_CASE(TestStateNames) {
    BOOST_CHECK_EQUAL(std::string(missileStateToString(MissileState::Flying)), "Flying");
    BOOST_CHECK_EQUAL(std::string(missileStateToString(MissileState::Exploding)), "Exploding");
    BOOST_CHECK_EQUAL(std::string(missileStateToString(MissileState::Finished)), "Finished");
}

BOOST_AUTO_TEST_SUITE_END()
