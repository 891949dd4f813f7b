/**
 * @file matrix.hpp
 * @brief Square matrices of order 1-4 and the affine transform builders.
 */

#ifndef _LUMEN_MATH_MATRIX_HPP_
#define _LUMEN_MATH_MATRIX_HPP_

#include "math/tuple.hpp"
#include <vector>
#include <iosfwd>

namespace lumen {

enum Axis { X_AXIS, Y_AXIS, Z_AXIS };

/**
 * A square matrix stored row-major. Scene transforms are always order 4;
 * smaller orders exist for submatrices and cofactor expansion.
 *
 * Construction from a value list whose length is not a perfect square
 * throws std::invalid_argument. Inverting a matrix whose determinant is zero
 * throws std::domain_error. The inverse is computed on every call.
 */
class Matrix
{
public:

    static const size_t MAX_ORDER = 4;

    // order-4 identity
    Matrix();
    Matrix( const real_t* values, size_t count );
    explicit Matrix( const std::vector<real_t>& values );

    size_t order() const { return n; }

    real_t operator()( size_t row, size_t col ) const
    {
        return m[row * MAX_ORDER + col];
    }

    real_t& operator()( size_t row, size_t col )
    {
        return m[row * MAX_ORDER + col];
    }

    Matrix transpose() const;
    Matrix submatrix( size_t row, size_t col ) const;
    real_t minor( size_t row, size_t col ) const;
    real_t cofactor( size_t row, size_t col ) const;
    real_t determinant() const;
    bool invertible() const;
    Matrix inverse() const;

    static Matrix identity( size_t order = 4 );
    static Matrix translation( real_t x, real_t y, real_t z );
    static Matrix scaling( real_t x, real_t y, real_t z );
    static Matrix rotation( Axis axis, real_t radians );
    static Matrix shearing( real_t x_y, real_t x_z, real_t y_x,
                            real_t y_z, real_t z_x, real_t z_y );
    static Matrix view_transform( const Tuple& from, const Tuple& to, const Tuple& up );

    /*
    Chaining builders. The receiver is applied first, the argument after it:
    m.translate(...).scale(...) translates, then scales. Each call returns
    builder * (*this), i.e. reading order, not multiplication order.
    */
    Matrix transform( const Matrix& next ) const;
    Matrix translate( real_t x, real_t y, real_t z ) const;
    Matrix scale( real_t x, real_t y, real_t z ) const;
    Matrix equiscale( real_t s ) const;
    Matrix rotate( Axis axis, real_t radians ) const;
    Matrix shear( real_t x_y, real_t x_z, real_t y_x,
                  real_t y_z, real_t z_x, real_t z_y ) const;

private:

    explicit Matrix( size_t order );

    size_t n;
    real_t m[MAX_ORDER * MAX_ORDER];
};

// orders must match, else std::invalid_argument
Matrix operator*( const Matrix& lhs, const Matrix& rhs );

// only order-4 matrices may multiply a tuple, else std::invalid_argument
Tuple operator*( const Matrix& lhs, const Tuple& rhs );

// element-wise, within EPSILON; different orders are never equal
bool operator==( const Matrix& lhs, const Matrix& rhs );
bool operator!=( const Matrix& lhs, const Matrix& rhs );

std::ostream& operator<<( std::ostream& os, const Matrix& mat );

} /* lumen */

#endif /* _LUMEN_MATH_MATRIX_HPP_ */
