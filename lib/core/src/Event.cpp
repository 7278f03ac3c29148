#include "toymc/core/Event.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>

namespace TOYMC {

std::string Event::ToString() const {
  std::ostringstream oss;
  oss << "Event[truth=" << truthIndex << " trigger=" << triggerNumber
      << " t=" << GetSeconds() << "s+" << std::setw(9) << std::setfill('0')
      << GetNanoSeconds() << "ns" << std::setfill(' ') << " site=" << site
      << " det=" << detector << " type=0x" << std::hex << triggerType
      << std::dec << " E=" << energy << "MeV nHit=" << nHit
      << " Q=" << charge << "PE pos=(" << x << ", " << y << ", " << z
      << ")mm]";
  return oss.str();
}

void Event::Print() const {
  std::cout << ToString() << std::endl;
  std::cout << "  fMax=" << fMax << " fQuad=" << fQuad
            << " fPSD_t1=" << fPSD_t1 << " fPSD_t2=" << fPSD_t2
            << " f2inch_maxQ=" << f2inch_maxQ << std::endl;
}

bool operator==(const Event &lhs, const Event &rhs) {
  return lhs.truthIndex == rhs.truthIndex &&
         lhs.triggerNumber == rhs.triggerNumber &&
         lhs.timeStampNs == rhs.timeStampNs && lhs.detector == rhs.detector &&
         lhs.triggerType == rhs.triggerType && lhs.site == rhs.site &&
         lhs.energy == rhs.energy && lhs.nHit == rhs.nHit &&
         lhs.charge == rhs.charge && lhs.x == rhs.x && lhs.y == rhs.y &&
         lhs.z == rhs.z && lhs.fMax == rhs.fMax && lhs.fQuad == rhs.fQuad &&
         lhs.fPSD_t1 == rhs.fPSD_t1 && lhs.fPSD_t2 == rhs.fPSD_t2 &&
         lhs.f2inch_maxQ == rhs.f2inch_maxQ;
}

bool operator!=(const Event &lhs, const Event &rhs) { return !(lhs == rhs); }

} // namespace TOYMC
