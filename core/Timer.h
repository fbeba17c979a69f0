#ifndef __vtkPointMapTimer_h
#define __vtkPointMapTimer_h

#include <algorithm>
#include <chrono>

namespace vtkPointMapType
{

// Monotonic stopwatch measuring in milliseconds
class Timer
{
public:
  Timer()
    : Start(std::chrono::steady_clock::now())
  {
  }

  void Restart() { this->Start = std::chrono::steady_clock::now(); }

  long long GetElapsedMilliseconds() const
  {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - this->Start)
      .count();
  }

  // Fraction of duration elapsed, clamped to [0, 1]. A non-positive
  // duration is always complete.
  double GetProgress(int durationMilliseconds) const
  {
    if (durationMilliseconds <= 0)
    {
      return 1.0;
    }
    const double t =
      static_cast<double>(this->GetElapsedMilliseconds()) / durationMilliseconds;
    return std::max(0.0, std::min(1.0, t));
  }

private:
  Timer(const Timer&) = delete;
  Timer& operator=(const Timer&) = delete;

  std::chrono::steady_clock::time_point Start;
};
}

#endif // __vtkPointMapTimer_h
