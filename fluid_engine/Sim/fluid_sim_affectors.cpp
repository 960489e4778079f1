#include "fluid_sim.h"

#include <algorithm>
#include <cstdio>

// -----------------------------------------------------------------------------
// Affector lists. Arenas are sized to the configured capacity and compacted on
// removal. Every mutation reseeds the velocity history of the whole list, so
// the first frame after it reports zero velocity for every entry.
// -----------------------------------------------------------------------------

void FluidSim::resizeAffectorArenas() {
    const size_t maxObjects = (size_t)m_settings.maxCollisionObjects;
    const size_t maxZones = (size_t)m_settings.maxForceZones;

    m_collisionObjects.reserve(maxObjects);
    m_collisionTracks.reserve(maxObjects);
    m_collisionRecords.assign(maxObjects, GpuCollisionObject{});

    m_forceZones.reserve(maxZones);
    m_forceZoneTracks.reserve(maxZones);
    m_forceZoneRecords.assign(maxZones, GpuForceZone{});

    m_numCollisionRecords = 0;
    m_numForceZoneRecords = 0;
}

void FluidSim::reseedCollisionTracks() {
    m_collisionTracks.assign(m_collisionObjects.size(), KinematicsTrack());
    for (size_t i = 0; i < m_collisionObjects.size(); ++i) {
        Pose p;
        if (m_collisionObjects[i].refreshFromSource(p)) m_collisionTracks[i].reseed(p);
    }
}

void FluidSim::reseedForceZoneTracks() {
    m_forceZoneTracks.assign(m_forceZones.size(), KinematicsTrack());
    for (size_t i = 0; i < m_forceZones.size(); ++i) {
        Pose p;
        if (m_forceZones[i].refreshFromSource(p)) m_forceZoneTracks[i].reseed(p);
    }
}

// --- Collision objects -------------------------------------------------------

bool FluidSim::addCollisionObject(const CollisionObject& obj) {
    if (collisionObjectCount() >= m_settings.maxCollisionObjects) {
        std::printf("[affectors] collision object list full (%d), add ignored\n",
                    m_settings.maxCollisionObjects);
        return false;
    }
    m_collisionObjects.push_back(obj);
    reseedCollisionTracks();
    return true;
}

bool FluidSim::removeCollisionObject(const CollisionObject& obj) {
    for (int i = 0; i < collisionObjectCount(); ++i) {
        if (m_collisionObjects[(size_t)i] == obj) return removeCollisionObjectAt(i);
    }
    return false;
}

bool FluidSim::removeCollisionObjectAt(int index) {
    if (index < 0 || index >= collisionObjectCount()) return false;
    m_collisionObjects.erase(m_collisionObjects.begin() + index);
    reseedCollisionTracks();
    return true;
}

void FluidSim::clearCollisionObjects() {
    m_collisionObjects.clear();
    reseedCollisionTracks();
}

bool FluidSim::getCollisionObject(int index, CollisionObject& out) const {
    if (index < 0 || index >= collisionObjectCount()) return false;
    out = m_collisionObjects[(size_t)index];
    return true;
}

bool FluidSim::updateCollisionObjectAt(int index, const CollisionObject& obj) {
    if (index < 0 || index >= collisionObjectCount()) return false;
    m_collisionObjects[(size_t)index] = obj;
    reseedCollisionTracks();
    return true;
}

// --- Force zones ---------------------------------------------------------------

bool FluidSim::addForceZone(const ForceZone& zone) {
    if (forceZoneCount() >= m_settings.maxForceZones) {
        std::printf("[affectors] force zone list full (%d), add ignored\n",
                    m_settings.maxForceZones);
        return false;
    }
    m_forceZones.push_back(zone);
    reseedForceZoneTracks();
    return true;
}

bool FluidSim::removeForceZone(const ForceZone& zone) {
    for (int i = 0; i < forceZoneCount(); ++i) {
        if (m_forceZones[(size_t)i] == zone) return removeForceZoneAt(i);
    }
    return false;
}

bool FluidSim::removeForceZoneAt(int index) {
    if (index < 0 || index >= forceZoneCount()) return false;
    m_forceZones.erase(m_forceZones.begin() + index);
    reseedForceZoneTracks();
    return true;
}

void FluidSim::clearForceZones() {
    m_forceZones.clear();
    reseedForceZoneTracks();
}

bool FluidSim::getForceZone(int index, ForceZone& out) const {
    if (index < 0 || index >= forceZoneCount()) return false;
    out = m_forceZones[(size_t)index];
    return true;
}

bool FluidSim::updateForceZoneAt(int index, const ForceZone& zone) {
    if (index < 0 || index >= forceZoneCount()) return false;
    m_forceZones[(size_t)index] = zone;
    reseedForceZoneTracks();
    return true;
}

// --- Per frame -------------------------------------------------------------------

// Entries whose source is gone or not ready keep last frame's pose and
// velocities.
void FluidSim::resampleAffectors(float hostDt) {
    for (size_t i = 0; i < m_collisionObjects.size(); ++i) {
        Pose p;
        if (m_collisionObjects[i].refreshFromSource(p)) m_collisionTracks[i].observe(p, hostDt);
    }
    for (size_t i = 0; i < m_forceZones.size(); ++i) {
        Pose p;
        if (m_forceZones[i].refreshFromSource(p)) m_forceZoneTracks[i].observe(p, hostDt);
    }
}

void FluidSim::uploadAffectors() {
    std::fill(m_collisionRecords.begin(), m_collisionRecords.end(), GpuCollisionObject{});
    for (size_t i = 0; i < m_collisionObjects.size(); ++i) {
        m_collisionRecords[i] = m_collisionObjects[i].toGpuRecord(m_collisionTracks[i]);
    }
    m_numCollisionRecords = (int)m_collisionObjects.size();

    std::fill(m_forceZoneRecords.begin(), m_forceZoneRecords.end(), GpuForceZone{});
    for (size_t i = 0; i < m_forceZones.size(); ++i) {
        m_forceZoneRecords[i] = m_forceZones[i].toGpuRecord(m_forceZoneTracks[i]);
    }
    m_numForceZoneRecords = (int)m_forceZones.size();
}
