#include "sbp/preprocess.hpp"
#include <opencv2/imgproc.hpp>

namespace sbp {
cv::Mat to_analysis_gray(const cv::Mat& bgr, cv::Size size){
  cv::Mat gray;
  switch(bgr.channels()){
    case 1: gray = bgr; break;
    case 4: cv::cvtColor(bgr, gray, cv::COLOR_BGRA2GRAY); break;
    default: cv::cvtColor(bgr, gray, cv::COLOR_BGR2GRAY); break;
  }
  if(gray.depth()!=CV_8U) gray.convertTo(gray, CV_8U);
  if(size.empty() || gray.size()==size) return gray.clone();
  cv::Mat out; cv::resize(gray, out, size, 0, 0, cv::INTER_AREA);
  return out;
}

double change_ratio(const cv::Mat& ref_gray, const cv::Mat& cur_gray, int tolerance){
  CV_Assert(ref_gray.type()==CV_8UC1 && cur_gray.type()==CV_8UC1 && ref_gray.size()==cur_gray.size());
  const double total = static_cast<double>(ref_gray.total());
  if(total==0) return 0.0;
  cv::Mat diff, mask;
  cv::absdiff(ref_gray, cur_gray, diff);
  cv::threshold(diff, mask, tolerance, 255, cv::THRESH_BINARY);
  return cv::countNonZero(mask) / total;
}
}
