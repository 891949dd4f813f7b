/**
 * @file matrix.cpp
 * @brief Matrix arithmetic, cofactor inversion and transform builders.
 */

#include "math/matrix.hpp"

#include <cstring>
#include <ostream>
#include <sstream>
#include <stdexcept>

namespace lumen {

static size_t order_for_count( size_t count )
{
    for ( size_t order = 1; order <= Matrix::MAX_ORDER; order++ ) {
        if ( order * order == count )
            return order;
    }

    std::ostringstream msg;
    msg << "matrix needs a perfect square number of values (1-"
        << Matrix::MAX_ORDER * Matrix::MAX_ORDER << "), got " << count;
    throw std::invalid_argument( msg.str() );
}

Matrix::Matrix( size_t order )
    : n( order )
{
    memset( m, 0, sizeof m );
}

Matrix::Matrix()
    : n( 4 )
{
    memset( m, 0, sizeof m );
    for ( size_t i = 0; i < n; i++ )
        (*this)( i, i ) = 1;
}

Matrix::Matrix( const real_t* values, size_t count )
    : n( order_for_count( count ) )
{
    memset( m, 0, sizeof m );
    for ( size_t row = 0; row < n; row++ )
        for ( size_t col = 0; col < n; col++ )
            (*this)( row, col ) = values[row * n + col];
}

Matrix::Matrix( const std::vector<real_t>& values )
    : n( order_for_count( values.size() ) )
{
    memset( m, 0, sizeof m );
    for ( size_t row = 0; row < n; row++ )
        for ( size_t col = 0; col < n; col++ )
            (*this)( row, col ) = values[row * n + col];
}

Matrix Matrix::transpose() const
{
    Matrix result( n );
    for ( size_t row = 0; row < n; row++ )
        for ( size_t col = 0; col < n; col++ )
            result( col, row ) = (*this)( row, col );
    return result;
}

Matrix Matrix::submatrix( size_t row, size_t col ) const
{
    if ( n < 2 )
        throw std::invalid_argument( "cannot take a submatrix of an order 1 matrix" );

    Matrix result( n - 1 );
    size_t dst_row = 0;

    for ( size_t src_row = 0; src_row < n; src_row++ ) {
        if ( src_row == row )
            continue;
        size_t dst_col = 0;
        for ( size_t src_col = 0; src_col < n; src_col++ ) {
            if ( src_col == col )
                continue;
            result( dst_row, dst_col ) = (*this)( src_row, src_col );
            dst_col++;
        }
        dst_row++;
    }

    return result;
}

real_t Matrix::minor( size_t row, size_t col ) const
{
    return submatrix( row, col ).determinant();
}

real_t Matrix::cofactor( size_t row, size_t col ) const
{
    real_t value = minor( row, col );
    return ( ( row + col ) % 2 == 0 ) ? value : -value;
}

real_t Matrix::determinant() const
{
    if ( n == 1 )
        return m[0];

    if ( n == 2 )
        return (*this)( 0, 0 ) * (*this)( 1, 1 ) - (*this)( 0, 1 ) * (*this)( 1, 0 );

    // cofactor expansion along the first row
    real_t det = 0;
    for ( size_t col = 0; col < n; col++ )
        det += (*this)( 0, col ) * cofactor( 0, col );
    return det;
}

bool Matrix::invertible() const
{
    return determinant() != 0;
}

Matrix Matrix::inverse() const
{
    real_t det = determinant();

    if ( det == 0 )
        throw std::domain_error( "matrix with zero determinant is not invertible" );

    Matrix result( n );
    for ( size_t row = 0; row < n; row++ ) {
        for ( size_t col = 0; col < n; col++ ) {
            // note the swapped indices: this builds the transposed cofactor matrix
            result( col, row ) = cofactor( row, col ) / det;
        }
    }
    return result;
}

Matrix Matrix::identity( size_t order )
{
    if ( order < 1 || order > MAX_ORDER )
        throw std::invalid_argument( "identity matrix order must be between 1 and 4" );

    Matrix result( order );
    for ( size_t i = 0; i < order; i++ )
        result( i, i ) = 1;
    return result;
}

Matrix Matrix::translation( real_t x, real_t y, real_t z )
{
    Matrix result;
    result( 0, 3 ) = x;
    result( 1, 3 ) = y;
    result( 2, 3 ) = z;
    return result;
}

Matrix Matrix::scaling( real_t x, real_t y, real_t z )
{
    Matrix result;
    result( 0, 0 ) = x;
    result( 1, 1 ) = y;
    result( 2, 2 ) = z;
    return result;
}

Matrix Matrix::rotation( Axis axis, real_t radians )
{
    real_t c = std::cos( radians );
    real_t s = std::sin( radians );
    Matrix result;

    switch ( axis )
    {
    case X_AXIS:
        result( 1, 1 ) = c;
        result( 1, 2 ) = -s;
        result( 2, 1 ) = s;
        result( 2, 2 ) = c;
        break;
    case Y_AXIS:
        result( 0, 0 ) = c;
        result( 0, 2 ) = s;
        result( 2, 0 ) = -s;
        result( 2, 2 ) = c;
        break;
    case Z_AXIS:
        result( 0, 0 ) = c;
        result( 0, 1 ) = -s;
        result( 1, 0 ) = s;
        result( 1, 1 ) = c;
        break;
    }

    return result;
}

Matrix Matrix::shearing( real_t x_y, real_t x_z, real_t y_x,
                         real_t y_z, real_t z_x, real_t z_y )
{
    Matrix result;
    result( 0, 1 ) = x_y;
    result( 0, 2 ) = x_z;
    result( 1, 0 ) = y_x;
    result( 1, 2 ) = y_z;
    result( 2, 0 ) = z_x;
    result( 2, 1 ) = z_y;
    return result;
}

Matrix Matrix::view_transform( const Tuple& from, const Tuple& to, const Tuple& up )
{
    Tuple forward = normalize( to - from );
    Tuple left = cross( forward, normalize( up ) );
    Tuple true_up = cross( left, forward );

    Matrix orientation;
    orientation( 0, 0 ) = left.x;
    orientation( 0, 1 ) = left.y;
    orientation( 0, 2 ) = left.z;
    orientation( 1, 0 ) = true_up.x;
    orientation( 1, 1 ) = true_up.y;
    orientation( 1, 2 ) = true_up.z;
    orientation( 2, 0 ) = -forward.x;
    orientation( 2, 1 ) = -forward.y;
    orientation( 2, 2 ) = -forward.z;

    return orientation * translation( -from.x, -from.y, -from.z );
}

Matrix Matrix::transform( const Matrix& next ) const
{
    return next * (*this);
}

Matrix Matrix::translate( real_t x, real_t y, real_t z ) const
{
    return translation( x, y, z ) * (*this);
}

Matrix Matrix::scale( real_t x, real_t y, real_t z ) const
{
    return scaling( x, y, z ) * (*this);
}

Matrix Matrix::equiscale( real_t s ) const
{
    return scaling( s, s, s ) * (*this);
}

Matrix Matrix::rotate( Axis axis, real_t radians ) const
{
    return rotation( axis, radians ) * (*this);
}

Matrix Matrix::shear( real_t x_y, real_t x_z, real_t y_x,
                      real_t y_z, real_t z_x, real_t z_y ) const
{
    return shearing( x_y, x_z, y_x, y_z, z_x, z_y ) * (*this);
}

Matrix operator*( const Matrix& lhs, const Matrix& rhs )
{
    size_t n = lhs.order();

    if ( rhs.order() != n )
        throw std::invalid_argument( "cannot multiply matrices of different order" );

    Matrix result = Matrix::identity( n );
    for ( size_t row = 0; row < n; row++ ) {
        for ( size_t col = 0; col < n; col++ ) {
            real_t sum = 0;
            for ( size_t k = 0; k < n; k++ )
                sum += lhs( row, k ) * rhs( k, col );
            result( row, col ) = sum;
        }
    }
    return result;
}

Tuple operator*( const Matrix& lhs, const Tuple& rhs )
{
    if ( lhs.order() != 4 )
        throw std::invalid_argument( "only order 4 matrices can multiply a tuple" );

    Tuple result;
    for ( size_t row = 0; row < 4; row++ ) {
        result[row] = lhs( row, 0 ) * rhs.x +
                      lhs( row, 1 ) * rhs.y +
                      lhs( row, 2 ) * rhs.z +
                      lhs( row, 3 ) * rhs.w;
    }
    return result;
}

bool operator==( const Matrix& lhs, const Matrix& rhs )
{
    if ( lhs.order() != rhs.order() )
        return false;

    for ( size_t row = 0; row < lhs.order(); row++ )
        for ( size_t col = 0; col < lhs.order(); col++ )
            if ( !approx_equal( lhs( row, col ), rhs( row, col ) ) )
                return false;
    return true;
}

bool operator!=( const Matrix& lhs, const Matrix& rhs )
{
    return !( lhs == rhs );
}

std::ostream& operator<<( std::ostream& os, const Matrix& mat )
{
    os << "[";
    for ( size_t row = 0; row < mat.order(); row++ ) {
        os << ( row ? "; " : "" );
        for ( size_t col = 0; col < mat.order(); col++ )
            os << ( col ? " " : "" ) << mat( row, col );
    }
    return os << "]";
}

} /* lumen */
