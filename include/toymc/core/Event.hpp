#ifndef TOYMC_CORE_EVENT_HPP
#define TOYMC_CORE_EVENT_HPP

#include <cstdint>
#include <string>

namespace TOYMC {

/**
 * @brief One simulated detector trigger
 *
 * Plain value record. Fields are listed in their fixed, documented order;
 * every generator fills all of them. Records carry no back-references and
 * are never modified once a generator has returned them.
 *
 * Units:
 * - timestamp: nanoseconds since the start of data taking
 * - energy: MeV
 * - charge: photoelectrons
 * - x, y, z: millimeters
 */
struct Event {
  uint32_t truthIndex = 0;    ///< Truth-label code of the physical subtype
  int32_t triggerNumber = 0;  ///< Per-detector trigger counter
  int64_t timeStampNs = 0;    ///< Trigger time (ns)
  int32_t detector = 0;       ///< Detector (AD) id, 6 for the water pool
  uint32_t triggerType = 0;   ///< Trigger type bitmask
  int32_t site = 0;           ///< Experimental hall (1, 2 or 4)
  float energy = 0.0f;        ///< Reconstructed energy (MeV)
  int32_t nHit = 0;           ///< Number of hit PMTs
  float charge = 0.0f;        ///< Nominal charge (PE)
  float x = 0.0f;             ///< Position x (mm)
  float y = 0.0f;             ///< Position y (mm)
  float z = 0.0f;             ///< Position z (mm)
  float fMax = 0.0f;          ///< Max charge fraction in one PMT
  float fQuad = 0.0f;         ///< Quadrant charge ratio
  float fPSD_t1 = 0.0f;       ///< First PSD discriminant
  float fPSD_t2 = 0.0f;       ///< Second PSD discriminant
  float f2inch_maxQ = 0.0f;   ///< 2-inch PMT max charge

  // ESUM + NHIT, the trigger type of most regular AD triggers
  static constexpr uint32_t kDefaultTriggerType = 0x10001100;

  static constexpr int64_t kNsPerSecond = 1000000000;

  int64_t GetSeconds() const { return timeStampNs / kNsPerSecond; }
  int64_t GetNanoSeconds() const { return timeStampNs % kNsPerSecond; }

  /// Copy of this record with a different trigger number
  Event WithTriggerNumber(int32_t number) const {
    Event copy = *this;
    copy.triggerNumber = number;
    return copy;
  }

  // Display methods
  void Print() const;
  std::string ToString() const;
};

bool operator==(const Event &lhs, const Event &rhs);
bool operator!=(const Event &lhs, const Event &rhs);

} // namespace TOYMC

#endif // TOYMC_CORE_EVENT_HPP
